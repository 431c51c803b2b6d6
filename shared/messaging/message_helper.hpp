#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "common/message.hpp"
#include "common/result.h"

namespace message
{

using json = nlohmann::json;

inline Result<json> toJson(const Message& msg) {
    json j = json::object();

    for (const auto& [key, val] : msg.values) {
        if (val.type() == typeid(int64_t)) {
            j[key] = std::any_cast<int64_t>(val);
        }
        else if (val.type() == typeid(int)) {
            j[key] = std::any_cast<int>(val);
        }
        else if (val.type() == typeid(double)) {
            j[key] = std::any_cast<double>(val);
        }
        else if (val.type() == typeid(bool)) {
            j[key] = std::any_cast<bool>(val);
        }
        else if (val.type() == typeid(std::string)) {
            j[key] = std::any_cast<std::string>(val);
        }
        else if (val.type() == typeid(std::vector<std::string>)) {
            j[key] = std::any_cast<std::vector<std::string>>(val);
        }
        else {
            return Result<json>::Error(ResultCode::NotSupported,
                "unsupported value type for key '" + key + "'");
        }
    }
    return Result<json>::OK(std::move(j));
}

// Invalid UTF-8 in string values is replaced with U+FFFD.
inline Result<std::string> serialize(const Message& msg) {
    auto j = toJson(msg);
    if (!j) return Result<std::string>::Error(j.code(), j.error());
    try {
        return Result<std::string>::OK(j.value().dump(-1, ' ', false, json::error_handler_t::replace));
    } catch (const json::exception& e) {
        return Result<std::string>::Error(ResultCode::ProtocolError, e.what());
    }
}

inline Result<Message> deserialize(const std::string& topic, const std::string& payload) {
    Message msg;
    msg.topic = topic;

    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        return Result<Message>::Error(ResultCode::ProtocolError, e.what());
    }
    if (!j.is_object()) {
        return Result<Message>::Error(ResultCode::ProtocolError, "payload is not a json object");
    }

    for (auto& [key, val] : j.items()) {
        if (val.is_number_integer()) {
            msg.values[key] = val.get<int64_t>();
        }
        else if (val.is_number_float()) {
            msg.values[key] = val.get<double>();
        }
        else if (val.is_boolean()) {
            msg.values[key] = val.get<bool>();
        }
        else if (val.is_string()) {
            msg.values[key] = val.get<std::string>();
        }
        else if (val.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : val) {
                if (item.is_string()) items.push_back(item.get<std::string>());
            }
            msg.values[key] = std::move(items);
        }
    }

    return Result<Message>::OK(std::move(msg));
}

} // namespace message
