// src/tempo/host/notifier.cpp
#include "tempo/host/notifier.hpp"
#include "tempo/utils/config.hpp"
#include "tempo/utils/logger.hpp"

namespace tempo {
namespace host {

const char* to_string(NotifyLevel level) {
    switch (level) {
        case NotifyLevel::INFO:
            return "info";
        case NotifyLevel::WARN:
            return "warn";
        case NotifyLevel::LOG_ERROR:
            return "error";
    }
    return "info";
}

void LogNotifier::notify(const Notification& notification) {
    utils::Logger* out = nullptr;
    switch (notification.level) {
        case NotifyLevel::INFO:
            out = &utils::Logger::info();
            break;
        case NotifyLevel::WARN:
            out = &utils::Logger::warn();
            break;
        case NotifyLevel::LOG_ERROR:
            out = &utils::Logger::error();
            break;
    }
    if (out == nullptr) {
        out = &utils::Logger::info();
    }

    if (!notification.title.empty()) {
        *out << "[" << notification.title << "] ";
    }
    // Multi-line bodies start on their own line so markdown stays readable
    if (notification.message.find('\n') != std::string::npos) {
        *out << '\n';
    }
    *out << notification.message << utils::Logger::endl;
}

std::string default_title() {
    return utils::Config::instance()->get(utils::config_keys::NOTIFY_TITLE, "tempo");
}

void markdown(Notifier& notifier, const std::vector<std::string>& lines) {
    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += lines[i];
    }

    Notification notification;
    notification.message = text;
    notification.level = NotifyLevel::INFO;
    notification.title = default_title();
    notification.markdown = true;
    notifier.notify(notification);
}

void info(Notifier& notifier, const std::string& message) {
    notifier.notify({message, NotifyLevel::INFO, default_title(), false});
}

void error(Notifier& notifier, const std::string& message) {
    notifier.notify({message, NotifyLevel::LOG_ERROR, default_title(), false});
}

} // namespace host
} // namespace tempo
