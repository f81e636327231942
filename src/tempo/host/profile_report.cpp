#include <tempo/host/profile_report.hpp>

namespace tempo::host {

std::vector<std::string> profile_report(const core::ProfileStack& stack) {
    std::vector<std::string> lines = {"# Profile"};
    for (const auto& line : stack.render()) {
        lines.push_back(line);
    }
    return lines;
}

void show_profile(const core::ProfileStack& stack, Notifier& notifier) {
    markdown(notifier, profile_report(stack));
}

} // namespace tempo::host
