#include "configuration_snapshot.hpp"

#include <cerrno>
#include <cstdlib>
#include <fmt/format.h>

#include "common/helper.hpp"

namespace config {

namespace {

std::optional<int64_t> parseInt(const std::string& raw) {
    const auto value = trim(raw);
    if (value.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') return std::nullopt;
    return static_cast<int64_t>(parsed);
}

std::optional<double> parseFloat(const std::string& raw) {
    const auto value = trim(raw);
    if (value.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (errno != 0 || end == value.c_str() || *end != '\0') return std::nullopt;
    return parsed;
}

std::optional<bool> parseBool(const std::string& raw) {
    const auto value = toLower(trim(raw));
    if (value == "true" || value == "1" || value == "yes" || value == "on" || value == "enabled")
        return true;
    if (value == "false" || value == "0" || value == "no" || value == "off" || value == "disabled")
        return false;
    return std::nullopt;
}

Result<void> missing(const std::string& key) {
    return Error(ResultCode::ConfigMissingRequired, fmt::format("missing required key '{}'", key));
}

Result<void> mismatch(const std::string& key, const std::string& value, ValueType type) {
    return Error(ResultCode::ConfigTypeMismatch,
        fmt::format("key '{}' value '{}' is not a {}", key, value, to_string(type)));
}

} // namespace

std::optional<Environment> parseEnvironment(const std::string& value) {
    const auto env = toLower(trim(value));
    if (env == "dev" || env == "development") return Environment::Development;
    if (env == "stage" || env == "staging") return Environment::Staging;
    if (env == "prod" || env == "production") return Environment::Production;
    if (env == "test" || env == "testing") return Environment::Testing;
    return std::nullopt;
}

ConfigurationSnapshot::ConfigurationSnapshot()
    : values_(std::make_shared<const Values>())
{
}

ConfigurationSnapshot::ConfigurationSnapshot(std::string service_name, Values values)
    : service_name_(std::move(service_name)),
      values_(std::make_shared<const Values>(std::move(values)))
{
    auto it = values_->find("ENVIRONMENT");
    if (it != values_->end()) {
        environment_ = parseEnvironment(it->second).value_or(Environment::Development);
    }
}

bool ConfigurationSnapshot::contains(const std::string& key) const {
    return values_->find(key) != values_->end();
}

std::optional<std::string> ConfigurationSnapshot::get(const std::string& key) const {
    auto it = values_->find(key);
    if (it == values_->end()) return std::nullopt;
    return it->second;
}

Result<std::string> ConfigurationSnapshot::getString(const std::string& key) const {
    auto value = get(key);
    if (!value) return missing(key);
    return Result<std::string>::OK(*value);
}

Result<int64_t> ConfigurationSnapshot::getInt(const std::string& key) const {
    auto value = get(key);
    if (!value) return missing(key);
    auto parsed = parseInt(*value);
    if (!parsed) return mismatch(key, *value, ValueType::Int);
    return Result<int64_t>::OK(*parsed);
}

Result<double> ConfigurationSnapshot::getFloat(const std::string& key) const {
    auto value = get(key);
    if (!value) return missing(key);
    auto parsed = parseFloat(*value);
    if (!parsed) return mismatch(key, *value, ValueType::Float);
    return Result<double>::OK(*parsed);
}

Result<bool> ConfigurationSnapshot::getBool(const std::string& key) const {
    auto value = get(key);
    if (!value) return missing(key);
    auto parsed = parseBool(*value);
    if (!parsed) return mismatch(key, *value, ValueType::Bool);
    return Result<bool>::OK(*parsed);
}

Result<std::vector<std::string>> ConfigurationSnapshot::getList(const std::string& key, char separator) const {
    auto value = get(key);
    if (!value) return missing(key);
    return Result<std::vector<std::string>>::OK(splitList(*value, separator));
}

std::string ConfigurationSnapshot::getString(const std::string& key, const std::string& fallback) const {
    return get(key).value_or(fallback);
}

int64_t ConfigurationSnapshot::getInt(const std::string& key, int64_t fallback) const {
    auto value = getInt(key);
    return value ? value.value() : fallback;
}

double ConfigurationSnapshot::getFloat(const std::string& key, double fallback) const {
    auto value = getFloat(key);
    return value ? value.value() : fallback;
}

bool ConfigurationSnapshot::getBool(const std::string& key, bool fallback) const {
    auto value = getBool(key);
    return value ? value.value() : fallback;
}

Result<void> ConfigurationSnapshot::checkType(const std::string& key, const std::string& value, ValueType type) {
    switch (type) {
        case ValueType::String:
        case ValueType::List:
            return OK();
        case ValueType::Int:
            return parseInt(value) ? OK() : mismatch(key, value, type);
        case ValueType::Float:
            return parseFloat(value) ? OK() : mismatch(key, value, type);
        case ValueType::Bool:
            return parseBool(value) ? OK() : mismatch(key, value, type);
    }
    return OK();
}

Result<void> ConfigurationSnapshot::validate(const std::vector<ConfigKey>& keys) const {
    for (const auto& key : keys) {
        auto value = get(key.name);
        if (!value) {
            if (key.required) return missing(key.name);
            continue;
        }
        auto res = checkType(key.name, *value, key.type);
        if (!res) return res;
    }
    return OK();
}

ValidationReport ConfigurationSnapshot::report(const std::vector<ConfigKey>& keys) const {
    ValidationReport out;
    for (const auto& key : keys) {
        auto value = get(key.name);
        if (!value) {
            if (key.required) out.missing_keys.push_back(key.name);
            continue;
        }
        if (!checkType(key.name, *value, key.type)) out.invalid_keys.push_back(key.name);
    }
    out.valid = out.missing_keys.empty() && out.invalid_keys.empty();
    return out;
}

ConfigurationSnapshot ConfigurationSnapshot::slice(const std::vector<ConfigKey>& keys, const std::string& prefix) const {
    Values out;
    // ENVIRONMENT travels with every slice so environment() stays meaningful
    if (auto env = get("ENVIRONMENT")) out.emplace("ENVIRONMENT", *env);

    for (const auto& key : keys) {
        auto value = get(key.name);
        if (value) out[key.name] = *value;
    }
    if (!prefix.empty()) {
        for (auto it = values_->lower_bound(prefix); it != values_->end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) break;
            out[it->first] = it->second;
        }
    }
    return ConfigurationSnapshot(service_name_, std::move(out));
}

} // namespace config
