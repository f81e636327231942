// src/tempo/host/uri_opener.cpp
#include "tempo/host/uri_opener.hpp"
#include "tempo/host/filesystem.hpp"
#include "tempo/utils/logger.hpp"
#include <array>
#include <cstdio>
#include <sstream>
#include <stdexcept>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace tempo {
namespace host {

Platform current_platform() {
#if defined(_WIN32)
    return Platform::WINDOWS;
#elif defined(__APPLE__)
    return Platform::MACOS;
#else
    return Platform::LINUX;
#endif
}

std::string shell_escape(const std::string& arg, Platform platform) {
    std::string quoted;
    if (platform == Platform::WINDOWS) {
        quoted += '"';
        for (char c : arg) {
            if (c == '"') {
                quoted += "\"\"";
            } else {
                quoted += c;
            }
        }
        quoted += '"';
        return quoted;
    }

    quoted += '\'';
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::vector<std::string> open_command(const std::string& uri, Platform platform) {
    switch (platform) {
        case Platform::WINDOWS:
            return {"cmd.exe", "/c", "start", "\"\"", shell_escape(uri, Platform::WINDOWS)};
        case Platform::MACOS:
            return {"open", uri};
        case Platform::LINUX:
            break;
    }
    return {"xdg-open", uri};
}

CommandResult run_command(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("run_command requires a program");
    }

    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
#ifdef _WIN32
        // Arguments for cmd.exe arrive already quoted
        line += arg;
#else
        line += shell_escape(arg, Platform::LINUX);
#endif
    }
    line += " 2>&1";

#ifdef _WIN32
    FILE* pipe = _popen(line.c_str(), "r");
#else
    FILE* pipe = popen(line.c_str(), "r");
#endif
    if (pipe == nullptr) {
        return {-1, "Failed to start " + argv.front()};
    }

    CommandResult result;
    std::array<char, 256> buffer{};
    size_t read = 0;
    while ((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), read);
    }

#ifdef _WIN32
    result.exit_code = _pclose(pipe);
#else
    int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + WTERMSIG(status);
    }
#endif
    return result;
}

std::string describe_command(const std::vector<std::string>& argv) {
    std::ostringstream out;
    out << "{ ";
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << '"';
        for (char c : argv[i]) {
            if (c == '"' || c == '\\') {
                out << '\\';
            }
            out << c;
        }
        out << '"';
    }
    out << " }";
    return out.str();
}

UriOpener::UriOpener(NotifierPtr notifier, ViewHandler view, CommandRunner runner, Platform platform)
    : notifier_(std::move(notifier)),
      view_(std::move(view)),
      runner_(std::move(runner)),
      platform_(platform) {
    if (!notifier_ || !runner_) {
        throw std::invalid_argument("UriOpener requires a notifier and a command runner");
    }
}

bool UriOpener::open(const std::string& uri) {
    if (view_ && file_exists(uri)) {
        view_(uri);
        return true;
    }

    std::vector<std::string> cmd = open_command(uri, platform_);
    CommandResult result = runner_(cmd);
    if (result.exit_code == 0) {
        return true;
    }

    utils::Logger::error() << "Opening " << uri << " exited with " << result.exit_code << utils::Logger::endl;
    error(*notifier_, "Failed to open uri\n" + result.output + "\n" + describe_command(cmd));
    return false;
}

} // namespace host
} // namespace tempo
