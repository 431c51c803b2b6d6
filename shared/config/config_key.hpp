#pragma once
#include <string>
#include <vector>

namespace config {

enum class ValueType { String, Int, Float, Bool, List };

// A key a utility reads from the snapshot. Required keys must be present in
// at least one layer; every declared key must coerce to its type.
struct ConfigKey {
    std::string name;
    ValueType type = ValueType::String;
    bool required = false;
};

inline ConfigKey requiredKey(std::string name, ValueType type = ValueType::String) {
    return ConfigKey{std::move(name), type, true};
}

inline ConfigKey optionalKey(std::string name, ValueType type = ValueType::String) {
    return ConfigKey{std::move(name), type, false};
}

constexpr const char* to_string(ValueType type) {
    switch (type) {
        case ValueType::String: return "string";
        case ValueType::Int:    return "int";
        case ValueType::Float:  return "float";
        case ValueType::Bool:   return "bool";
        case ValueType::List:   return "list";
    }
    return "unknown";
}

} // namespace config
