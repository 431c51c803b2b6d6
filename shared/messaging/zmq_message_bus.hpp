#pragma once
#include <mutex>
#include <string>

#include "message_bus.hpp"

namespace messaging {

// ZeroMQ PUB socket bound to one endpoint. Frames: [topic][json payload].
// Sends never wait; with no subscriber attached messages are dropped by zmq.
class ZmqMessageBus : public MessageBus {
public:
    inline static constexpr const char* LOG_TAG = "ZmqMessageBus";

    explicit ZmqMessageBus(std::string endpoint);
    ~ZmqMessageBus() override;

    ZmqMessageBus(const ZmqMessageBus&) = delete;
    ZmqMessageBus& operator=(const ZmqMessageBus&) = delete;

    Result<void> publish(const message::Message& msg) override;
    std::string endpoint() const override { return endpoint_; }

private:
    Result<void> ensureSocket_();

    std::string endpoint_;
    void* context_ = nullptr;
    void* pub_socket_ = nullptr;
    std::mutex mutex_;
};

} // namespace messaging
