// include/tempo/core/profile_stack.hpp
#pragma once
#include <tempo/core/clock.hpp>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tempo {
namespace core {

// Thrown by ProfileStack::exit() when no span is open
class StackUnderflow : public std::runtime_error {
public:
    StackUnderflow() : std::runtime_error("ProfileStack::exit() called with no open span") {}
};

struct ProfileEntry {
    std::string name;
    Nanoseconds start{0};
    Nanoseconds elapsed{0};
    bool open = false;
    std::vector<std::unique_ptr<ProfileEntry>> children;

    ProfileEntry() = default;
    explicit ProfileEntry(std::string entry_name) : name(std::move(entry_name)) {}

    // Milliseconds truncated to two decimals, 0 while still open
    double elapsed_ms() const;
};

// "<indent>- <name>: **<ms>ms**" with two spaces of indent per level
std::string format_profile_line(const ProfileEntry& entry, size_t depth);

// Lazy pre-order view over a profile tree. Each begin() restarts the walk.
class ProfileLines {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(const ProfileEntry* root);

        reference operator*() const { return line_; }
        pointer operator->() const { return &line_; }
        iterator& operator++();
        iterator operator++(int) {
            iterator copy = *this;
            ++*this;
            return copy;
        }

        size_t depth() const { return depth_; }
        const ProfileEntry* entry() const { return current_; }

        bool operator==(const iterator& other) const {
            return current_ == other.current_ && depth_ == other.depth_;
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        struct Frame {
            const ProfileEntry* entry;
            size_t next_child;
        };

        void advance();

        std::vector<Frame> frames_;
        const ProfileEntry* current_ = nullptr;
        size_t depth_ = 0;
        std::string line_;
    };

    explicit ProfileLines(const ProfileEntry* root) : root_(root) {}

    iterator begin() const { return iterator(root_); }
    iterator end() const { return iterator(); }
    bool empty() const { return root_ == nullptr || root_->children.empty(); }

    std::vector<std::string> to_vector() const {
        return std::vector<std::string>(begin(), end());
    }

private:
    const ProfileEntry* root_;
};

// Tree of nested timed spans. Spans close in strict reverse order of opening.
class ProfileStack {
private:
    ClockPtr clock_;
    std::unique_ptr<ProfileEntry> root_;
    // Root at the bottom, innermost open span on top
    std::vector<ProfileEntry*> open_;
    uint64_t generation_ = 0;

    ProfileEntry& attach(std::unique_ptr<ProfileEntry> entry);

public:
    explicit ProfileStack(ClockPtr clock = std::make_shared<SteadyClock>(),
                          std::string root_name = "session");

    ProfileStack(const ProfileStack&) = delete;
    ProfileStack& operator=(const ProfileStack&) = delete;
    ProfileStack(ProfileStack&&) = delete;
    ProfileStack& operator=(ProfileStack&&) = delete;

    ProfileEntry& enter(std::string name);
    ProfileEntry& exit();

    // Attach a span measured elsewhere under the innermost open span
    ProfileEntry& record(std::string name, Nanoseconds elapsed);

    ProfileLines render() const { return ProfileLines(root_.get()); }

    void clear();

    size_t depth() const { return open_.size() - 1; }
    const ProfileEntry& root() const { return *root_; }
    // Innermost open span, nullptr when only the root remains
    const ProfileEntry* top() const { return depth() == 0 ? nullptr : open_.back(); }
    // Bumped by clear(), lets holders of entry pointers detect a reset
    uint64_t generation() const { return generation_; }
};

// Opens a span for the lifetime of the scope
class ProfileScope {
public:
    ProfileScope(ProfileStack& stack, std::string name);
    ~ProfileScope();

    ProfileScope(const ProfileScope&) = delete;
    ProfileScope& operator=(const ProfileScope&) = delete;

private:
    ProfileStack& stack_;
    const ProfileEntry* entry_;
    uint64_t generation_;
};

} // namespace core
} // namespace tempo
