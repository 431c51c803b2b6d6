#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/result.h"
#include "config_key.hpp"

namespace config {

enum class Environment { Development, Staging, Production, Testing };

constexpr const char* to_string(Environment env) {
    switch (env) {
        case Environment::Development: return "development";
        case Environment::Staging:     return "staging";
        case Environment::Production:  return "production";
        case Environment::Testing:     return "testing";
    }
    return "development";
}

// Parses "dev", "prod", "stage", "test" and the long forms.
std::optional<Environment> parseEnvironment(const std::string& value);

struct ValidationReport {
    bool valid = true;
    std::vector<std::string> missing_keys;
    std::vector<std::string> invalid_keys;
};

// Immutable view of the resolved configuration of one container generation.
// Copies share the same underlying map.
class ConfigurationSnapshot {
public:
    using Values = std::map<std::string, std::string>;

    ConfigurationSnapshot();
    ConfigurationSnapshot(std::string service_name, Values values);

    const std::string& serviceName() const noexcept { return service_name_; }
    Environment environment() const noexcept { return environment_; }
    bool isDevelopment() const noexcept { return environment_ == Environment::Development; }
    bool isProduction() const noexcept { return environment_ == Environment::Production; }
    bool isStaging() const noexcept { return environment_ == Environment::Staging; }
    bool isTesting() const noexcept { return environment_ == Environment::Testing; }

    bool contains(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;
    const Values& values() const noexcept { return *values_; }
    size_t size() const noexcept { return values_->size(); }

    Result<std::string> getString(const std::string& key) const;
    Result<int64_t> getInt(const std::string& key) const;
    Result<double> getFloat(const std::string& key) const;
    Result<bool> getBool(const std::string& key) const;
    Result<std::vector<std::string>> getList(const std::string& key, char separator = ',') const;

    std::string getString(const std::string& key, const std::string& fallback) const;
    int64_t getInt(const std::string& key, int64_t fallback) const;
    double getFloat(const std::string& key, double fallback) const;
    bool getBool(const std::string& key, bool fallback) const;

    // First failing key wins: ConfigMissingRequired or ConfigTypeMismatch.
    Result<void> validate(const std::vector<ConfigKey>& keys) const;
    ValidationReport report(const std::vector<ConfigKey>& keys) const;

    // Declared keys plus every key starting with prefix (empty prefix adds nothing).
    ConfigurationSnapshot slice(const std::vector<ConfigKey>& keys, const std::string& prefix) const;

    static Result<void> checkType(const std::string& key, const std::string& value, ValueType type);

private:
    std::string service_name_;
    std::shared_ptr<const Values> values_;
    Environment environment_ = Environment::Development;
};

} // namespace config
