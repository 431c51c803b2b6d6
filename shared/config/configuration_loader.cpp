#include "configuration_loader.hpp"

#include "logging/logging.hpp"

namespace config {

ConfigurationLoader::ConfigurationLoader() {
    layers_[static_cast<size_t>(Layer::Defaults)].push_back(
        std::make_shared<MapConfigSource>("builtin", builtinDefaults()));
}

void ConfigurationLoader::addStandardSources(const std::string& config_dir) {
    const std::string dir = config_dir.empty() ? "." : config_dir;
    addSource(Layer::Infrastructure, std::make_shared<YamlConfigSource>(dir + "/infrastructure.yaml"));
    addSource(Layer::Infrastructure, std::make_shared<EnvironmentConfigSource>());
    addSource(Layer::Secrets, std::make_shared<EnvFileConfigSource>(dir + "/.env.secrets"));
}

const Values& ConfigurationLoader::builtinDefaults() {
    static const Values defaults = {
        {"ENVIRONMENT",                  "development"},
        {"LOG_LEVEL",                    "info"},
        {"MULTI_TENANT_ENABLED",         "true"},
        {"DEFAULT_TENANT_MAX_USERS",     "50"},
        {"TENANT_ISOLATION_STRICT",      "true"},
        {"TENANT_ALLOWED_ROLES",         "admin,member,viewer"},
        {"HEALTH_CHECK_INTERVAL",        "30"},
        {"TELEMETRY_EXPORTER",           "log"},
        {"TELEMETRY_TIMEOUT_MS",         "200"},
        {"TELEMETRY_QUEUE_SIZE",         "1024"},
        {"SECURITY_PLATFORM_ADMIN_ROLE", "platform_admin"},
    };
    return defaults;
}

void ConfigurationLoader::addSource(Layer layer, ConfigSourcePtr source) {
    if (!source) return;
    std::lock_guard<std::mutex> lock(mutex_);
    layers_[static_cast<size_t>(layer)].push_back(std::move(source));
}

void ConfigurationLoader::requireKey(ConfigKey key) {
    key.required = true;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : required_) {
        if (existing.name == key.name) {
            existing = std::move(key);
            return;
        }
    }
    required_.push_back(std::move(key));
}

void ConfigurationLoader::merge_(Values& into, const Values& layer) {
    for (const auto& [key, value] : layer) {
        auto it = into.find(key);
        if (it == into.end()) {
            into.emplace(key, value);
        } else if (!value.empty()) {
            it->second = value;
        }
    }
}

Result<ConfigurationSnapshot> ConfigurationLoader::load(const std::string& service_name,
                                                        const Values& overrides) const {
    std::array<std::vector<ConfigSourcePtr>, 4> layers;
    std::vector<ConfigKey> required;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        layers = layers_;
        required = required_;
    }

    Values merged;
    for (size_t i = 0; i < layers.size(); ++i) {
        for (const auto& source : layers[i]) {
            auto values = source->load(service_name);
            if (!values) {
                LOGW("[{}] skipped source {} ({}): {}", service_name, source->name(),
                     to_string(static_cast<Layer>(i)), to_string(values));
                continue;
            }
            merge_(merged, values.value());
        }
    }
    merge_(merged, overrides);

    if (auto env = merged.find("ENVIRONMENT"); env != merged.end() && !parseEnvironment(env->second)) {
        LOGW("[{}] unknown ENVIRONMENT '{}', using development", service_name, env->second);
    }

    ConfigurationSnapshot snapshot(service_name, std::move(merged));
    auto valid = snapshot.validate(required);
    if (!valid) {
        LOGE("[{}] configuration rejected: {}", service_name, to_string(valid));
        return valid;
    }

    LOGD("[{}] configuration loaded: {} keys, environment {}", service_name,
         snapshot.size(), to_string(snapshot.environment()));
    return Result<ConfigurationSnapshot>::OK(std::move(snapshot));
}

} // namespace config
