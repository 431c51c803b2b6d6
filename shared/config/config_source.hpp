#pragma once
#include <map>
#include <memory>
#include <set>
#include <string>

#include "common/result.h"

namespace config {

using Values = std::map<std::string, std::string>;

// A provider of environment-style key/value pairs.
class ConfigSource {
public:
    virtual ~ConfigSource() = default;

    virtual std::string name() const = 0;

    // Failure means the source could not be read; the loader logs and skips it.
    virtual Result<Values> load(const std::string& service_name) const = 0;
};

using ConfigSourcePtr = std::shared_ptr<ConfigSource>;

// Fixed values, mostly for tests and embedded defaults.
class MapConfigSource : public ConfigSource {
public:
    MapConfigSource(std::string name, Values values)
        : name_(std::move(name)), values_(std::move(values)) {}

    std::string name() const override { return name_; }
    Result<Values> load(const std::string&) const override { return Result<Values>::OK(values_); }

private:
    std::string name_;
    Values values_;
};

// Reads the process environment. With a prefix only matching variables are
// taken and the prefix is stripped ("TC_LOG_LEVEL" -> "LOG_LEVEL").
class EnvironmentConfigSource : public ConfigSource {
public:
    explicit EnvironmentConfigSource(std::string prefix = "") : prefix_(std::move(prefix)) {}

    std::string name() const override { return "environment"; }
    Result<Values> load(const std::string& service_name) const override;

private:
    std::string prefix_;
};

// Flattens a YAML document into UPPER_SNAKE keys:
//   telemetry: { exporter: http }  ->  TELEMETRY_EXPORTER=http
// Sequences become comma separated lists. A missing file yields no values.
class YamlConfigSource : public ConfigSource {
public:
    explicit YamlConfigSource(std::string path) : path_(std::move(path)) {}

    std::string name() const override { return "yaml:" + path_; }
    Result<Values> load(const std::string& service_name) const override;

private:
    std::string path_;
};

// KEY=VALUE lines with '#' comments and optional quoting. Infrastructure
// credential keys are never taken from such files.
class EnvFileConfigSource : public ConfigSource {
public:
    explicit EnvFileConfigSource(std::string path) : path_(std::move(path)) {}

    std::string name() const override { return "envfile:" + path_; }
    Result<Values> load(const std::string& service_name) const override;

    static const std::set<std::string>& blockedKeys();

private:
    std::string path_;
};

} // namespace config
