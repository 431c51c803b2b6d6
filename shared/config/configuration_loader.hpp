#pragma once
#include <array>
#include <mutex>
#include <string>
#include <vector>

#include "common/result.h"
#include "config_key.hpp"
#include "config_source.hpp"
#include "configuration_snapshot.hpp"

namespace config {

// Ascending precedence.
enum class Layer { Defaults = 0, Infrastructure, Secrets, Overrides };

constexpr const char* to_string(Layer layer) {
    switch (layer) {
        case Layer::Defaults:       return "defaults";
        case Layer::Infrastructure: return "infrastructure";
        case Layer::Secrets:        return "secrets";
        case Layer::Overrides:      return "overrides";
    }
    return "unknown";
}

// Merges layered sources into a ConfigurationSnapshot.
//
// Within a layer, sources added later win. A higher layer wins over a lower
// one, except that an empty value never replaces a non-empty one. Sources
// that fail to load are logged and skipped. The loader only reads the
// process environment.
class ConfigurationLoader {
public:
    inline static constexpr const char* LOG_TAG = "ConfigurationLoader";

    // Starts with the built-in defaults as the lowest layer.
    ConfigurationLoader();

    // Environment, <dir>/infrastructure.yaml and <dir>/.env.secrets.
    void addStandardSources(const std::string& config_dir);

    static const Values& builtinDefaults();

    void addSource(Layer layer, ConfigSourcePtr source);
    void requireKey(ConfigKey key);

    Result<ConfigurationSnapshot> load(const std::string& service_name,
                                       const Values& overrides = {}) const;

private:
    static void merge_(Values& into, const Values& layer);

    std::array<std::vector<ConfigSourcePtr>, 4> layers_;
    std::vector<ConfigKey> required_;
    mutable std::mutex mutex_;
};

} // namespace config
