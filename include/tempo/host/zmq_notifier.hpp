// include/tempo/host/zmq_notifier.hpp
#pragma once
#include "tempo/host/notifier.hpp"
#include <zmq.hpp>
#include <memory>
#include <string>

namespace tempo {
namespace host {

// Publishes notifications to a host UI over a PUB socket. Each notification
// is one multipart message: [title, level, "markdown"|"plain", body].
class ZmqNotifier : public Notifier {
private:
    std::string endpoint_;
    std::shared_ptr<zmq::context_t> context_;
    zmq::socket_t socket_;

public:
    explicit ZmqNotifier(const std::string& endpoint,
                         std::shared_ptr<zmq::context_t> context = std::make_shared<zmq::context_t>(1));

    void notify(const Notification& notification) override;

    const std::string& endpoint() const { return endpoint_; }
};

} // namespace host
} // namespace tempo
