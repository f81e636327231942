#include <tempo/core/profile_stack.hpp>
#include <tempo/utils/logger.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tempo::core {

double ProfileEntry::elapsed_ms() const {
    if (open) {
        return 0.0;
    }
    return std::floor(static_cast<double>(elapsed.count()) / 1e6 * 100) / 100;
}

std::string format_profile_line(const ProfileEntry& entry, size_t depth) {
    std::ostringstream line;
    line << std::string(depth * 2, ' ') << "- " << entry.name << ": **"
         << std::setprecision(14) << entry.elapsed_ms() << "ms**";
    return line.str();
}

ProfileLines::iterator::iterator(const ProfileEntry* root) {
    if (root != nullptr) {
        frames_.push_back({root, 0});
        advance();
    }
}

ProfileLines::iterator& ProfileLines::iterator::operator++() {
    if (current_ != nullptr) {
        frames_.push_back({current_, 0});
        advance();
    }
    return *this;
}

void ProfileLines::iterator::advance() {
    while (!frames_.empty()) {
        Frame& top = frames_.back();
        if (top.next_child < top.entry->children.size()) {
            current_ = top.entry->children[top.next_child++].get();
            depth_ = frames_.size();
            line_ = format_profile_line(*current_, depth_);
            return;
        }
        frames_.pop_back();
    }
    current_ = nullptr;
    depth_ = 0;
    line_.clear();
}

ProfileStack::ProfileStack(ClockPtr clock, std::string root_name)
    : clock_(std::move(clock)),
      root_(std::make_unique<ProfileEntry>(std::move(root_name))) {
    if (!clock_) {
        throw std::invalid_argument("ProfileStack requires a clock");
    }
    open_.push_back(root_.get());
}

ProfileEntry& ProfileStack::attach(std::unique_ptr<ProfileEntry> entry) {
    auto& siblings = open_.back()->children;
    siblings.push_back(std::move(entry));
    return *siblings.back();
}

ProfileEntry& ProfileStack::enter(std::string name) {
    auto entry = std::make_unique<ProfileEntry>(std::move(name));
    entry->start = clock_->now();
    entry->open = true;

    ProfileEntry& attached = attach(std::move(entry));
    open_.push_back(&attached);
    return attached;
}

ProfileEntry& ProfileStack::exit() {
    if (depth() == 0) {
        utils::Logger::error() << "Profile stack underflow: exit() without a matching enter()"
                               << utils::Logger::endl;
        throw StackUnderflow();
    }

    ProfileEntry* entry = open_.back();
    open_.pop_back();

    Nanoseconds end = clock_->now();
    entry->elapsed = end > entry->start ? end - entry->start : Nanoseconds::zero();
    entry->open = false;
    return *entry;
}

ProfileEntry& ProfileStack::record(std::string name, Nanoseconds elapsed) {
    if (elapsed < Nanoseconds::zero()) {
        throw std::invalid_argument("Recorded span '" + name + "' has a negative duration");
    }

    auto entry = std::make_unique<ProfileEntry>(std::move(name));
    entry->start = clock_->now();
    entry->elapsed = elapsed;
    return attach(std::move(entry));
}

void ProfileStack::clear() {
    // Reset in place so views from render() stay valid and just go empty
    root_->children.clear();
    root_->start = Nanoseconds::zero();
    root_->elapsed = Nanoseconds::zero();
    open_.clear();
    open_.push_back(root_.get());
    ++generation_;
    utils::Logger::debug() << "Profile stack '" << root_->name << "' cleared" << utils::Logger::endl;
}

ProfileScope::ProfileScope(ProfileStack& stack, std::string name)
    : stack_(stack),
      entry_(&stack.enter(std::move(name))),
      generation_(stack.generation()) {}

ProfileScope::~ProfileScope() {
    if (stack_.generation() != generation_) {
        utils::Logger::warn() << "Profile stack was cleared while a scoped span was open"
                              << utils::Logger::endl;
        return;
    }
    if (stack_.top() != entry_) {
        utils::Logger::warn() << "Scoped span '" << entry_->name
                              << "' is not the innermost open span, leaving it open"
                              << utils::Logger::endl;
        return;
    }
    stack_.exit();
}

} // namespace tempo::core
