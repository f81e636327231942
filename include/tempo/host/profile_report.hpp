#pragma once
#include <tempo/core/profile_stack.hpp>
#include <tempo/host/notifier.hpp>
#include <string>
#include <vector>

namespace tempo::host {

// "# Profile" heading followed by one line per span
std::vector<std::string> profile_report(const core::ProfileStack& stack);

void show_profile(const core::ProfileStack& stack, Notifier& notifier);

} // namespace tempo::host
