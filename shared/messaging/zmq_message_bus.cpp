#include "zmq_message_bus.hpp"

#include <zmq.h>

#include "logging/logging.hpp"
#include "message_helper.hpp"

namespace messaging {

namespace {

std::string zmqError() {
    return zmq_strerror(zmq_errno());
}

} // namespace

ZmqMessageBus::ZmqMessageBus(std::string endpoint)
    : endpoint_(std::move(endpoint))
{
    context_ = zmq_ctx_new();
}

ZmqMessageBus::~ZmqMessageBus()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (pub_socket_) zmq_close(pub_socket_);
    if (context_) zmq_ctx_term(context_);
}

Result<void> ZmqMessageBus::ensureSocket_()
{
    if (pub_socket_) return OK();
    if (!context_) return Error(ResultCode::SocketError, "zmq context not available");

    void* socket = zmq_socket(context_, ZMQ_PUB);
    if (!socket) return Error(ResultCode::SocketError, "zmq_socket: " + zmqError());

    int linger = 0;
    zmq_setsockopt(socket, ZMQ_LINGER, &linger, sizeof(linger));

    if (zmq_bind(socket, endpoint_.c_str()) != 0) {
        auto err = zmqError();
        zmq_close(socket);
        return Error(ResultCode::ConnectionFail, "zmq_bind " + endpoint_ + ": " + err);
    }
    pub_socket_ = socket;
    LOGI("publishing on {}", endpoint_);
    return OK();
}

Result<void> ZmqMessageBus::publish(const message::Message& msg)
{
    auto payload = message::serialize(msg);
    if (!payload) return Error(payload.code(), payload.error());

    std::lock_guard<std::mutex> lock(mutex_);
    auto res = ensureSocket_();
    if (!res) return res;

    const auto& body = payload.value();
    if (zmq_send(pub_socket_, msg.topic.data(), msg.topic.size(), ZMQ_SNDMORE | ZMQ_DONTWAIT) < 0 ||
        zmq_send(pub_socket_, body.data(), body.size(), ZMQ_DONTWAIT) < 0) {
        return Error(ResultCode::SocketError, "zmq_send: " + zmqError());
    }
    return OK();
}

} // namespace messaging
