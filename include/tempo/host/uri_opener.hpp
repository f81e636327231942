// include/tempo/host/uri_opener.hpp
#pragma once
#include "tempo/host/notifier.hpp"
#include <functional>
#include <string>
#include <vector>

namespace tempo {
namespace host {

enum class Platform {
    WINDOWS,
    MACOS,
    LINUX
};

Platform current_platform();

struct CommandResult {
    int exit_code = 0;
    std::string output;
};

using CommandRunner = std::function<CommandResult(const std::vector<std::string>&)>;
using ViewHandler = std::function<void(const std::string&)>;

// Quote one argument for the platform's shell
std::string shell_escape(const std::string& arg, Platform platform = current_platform());

// argv of the platform's "open with default application" command
std::vector<std::string> open_command(const std::string& uri, Platform platform = current_platform());

// Runs argv through the shell, stdout and stderr captured together
CommandResult run_command(const std::vector<std::string>& argv);

// { "a", "b" } rendering used in error messages
std::string describe_command(const std::vector<std::string>& argv);

class UriOpener {
private:
    NotifierPtr notifier_;
    ViewHandler view_;
    CommandRunner runner_;
    Platform platform_;

public:
    UriOpener(NotifierPtr notifier, ViewHandler view,
              CommandRunner runner = run_command,
              Platform platform = current_platform());

    // Existing paths go to the view handler, anything else to the system
    // opener. Returns false, after an error notification, when the opener fails.
    bool open(const std::string& uri);
};

} // namespace host
} // namespace tempo
