#pragma once

#include <any>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>


namespace message {

// Loosely typed payload passed to agent commands and published on the bus.
// Supported value types: std::string, int64_t, double, bool and
// std::vector<std::string>.
struct Message {
    std::string topic;
    std::unordered_map<std::string, std::any> values;

    template<typename T>
    Message& set(const std::string& key, T value) {
        values[key] = std::move(value);
        return *this;
    }

    Message& set(const std::string& key, const char* value) {
        values[key] = std::string(value);
        return *this;
    }

    Message& set(const std::string& key, int value) {
        values[key] = static_cast<int64_t>(value);
        return *this;
    }

    bool has(const std::string& key) const {
        return values.find(key) != values.end();
    }

    template<typename T>
    std::optional<T> get(const std::string& key) const {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        if (const T* value = std::any_cast<T>(&it->second)) return *value;
        return std::nullopt;
    }

    std::string getString(const std::string& key, const std::string& fallback = "") const {
        return get<std::string>(key).value_or(fallback);
    }
};

} // namespace message
