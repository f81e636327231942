// src/tempo/host/zmq_notifier.cpp
#include "tempo/host/zmq_notifier.hpp"
#include "tempo/utils/logger.hpp"
#include <stdexcept>

namespace tempo {
namespace host {

ZmqNotifier::ZmqNotifier(const std::string& endpoint, std::shared_ptr<zmq::context_t> context)
    : endpoint_(endpoint),
      context_(std::move(context)),
      socket_(*context_, zmq::socket_type::pub) {
    try {
        socket_.set(zmq::sockopt::linger, 0);
        socket_.bind(endpoint_);
    } catch (const zmq::error_t& e) {
        throw std::runtime_error("Failed to bind notification socket at " + endpoint_ + ": " + e.what());
    }

    utils::Logger::info() << "Publishing notifications on " << endpoint_ << utils::Logger::endl;
}

void ZmqNotifier::notify(const Notification& notification) {
    const std::string level = to_string(notification.level);
    const std::string format = notification.markdown ? "markdown" : "plain";

    auto send_frame = [this](const std::string& frame, zmq::send_flags flags) {
        if (!socket_.send(zmq::buffer(frame), flags)) {
            throw std::runtime_error("Notification socket on " + endpoint_ + " would block");
        }
    };

    try {
        send_frame(notification.title, zmq::send_flags::sndmore);
        send_frame(level, zmq::send_flags::sndmore);
        send_frame(format, zmq::send_flags::sndmore);
        send_frame(notification.message, zmq::send_flags::none);
    } catch (const zmq::error_t& e) {
        throw std::runtime_error("Failed to publish notification on " + endpoint_ + ": " + e.what());
    }
}

} // namespace host
} // namespace tempo
