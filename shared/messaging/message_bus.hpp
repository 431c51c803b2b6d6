#pragma once
#include <string>

#include "common/message.hpp"
#include "common/result.h"

namespace messaging {

class MessageBus {
public:
    virtual ~MessageBus() = default;

    // PUB; must not block the caller
    virtual Result<void> publish(const message::Message& msg) = 0;

    virtual std::string endpoint() const = 0;
};

} // namespace messaging
