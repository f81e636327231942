// include/tempo/host/notifier.hpp
#pragma once
#include <memory>
#include <string>
#include <vector>

namespace tempo {
namespace host {

enum class NotifyLevel {
    INFO,
    WARN,
    LOG_ERROR
};

const char* to_string(NotifyLevel level);

struct Notification {
    std::string message;
    NotifyLevel level = NotifyLevel::INFO;
    std::string title;
    bool markdown = false;
};

// Display surface for user-facing messages
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const Notification& notification) = 0;
};

using NotifierPtr = std::shared_ptr<Notifier>;

// Writes notifications through the Logger
class LogNotifier : public Notifier {
public:
    void notify(const Notification& notification) override;
};

// Title used when a helper builds the notification, from notify.title
std::string default_title();

// Lines are joined with '\n' into one markdown notification
void markdown(Notifier& notifier, const std::vector<std::string>& lines);
void info(Notifier& notifier, const std::string& message);
void error(Notifier& notifier, const std::string& message);

} // namespace host
} // namespace tempo
