#include "config_source.hpp"

#include <fstream>
#include <yaml-cpp/yaml.h>

#include "common/helper.hpp"
#include "logging/logging.hpp"

extern char** environ;

namespace config {

namespace {

constexpr const char* TAG = "Config";

std::string flattenKey(const std::string& parent, const std::string& key) {
    auto upper = toUpper(key);
    for (auto& c : upper) {
        if (c == '-' || c == '.' || c == ' ') c = '_';
    }
    return parent.empty() ? upper : parent + "_" + upper;
}

void flatten(const YAML::Node& node, const std::string& prefix, Values& out) {
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& item : node) {
                flatten(item.second, flattenKey(prefix, item.first.as<std::string>()), out);
            }
            break;
        case YAML::NodeType::Sequence: {
            std::string joined;
            for (const auto& item : node) {
                if (!item.IsScalar()) continue;
                if (!joined.empty()) joined += ",";
                joined += item.as<std::string>();
            }
            if (!prefix.empty()) out[prefix] = joined;
            break;
        }
        case YAML::NodeType::Scalar:
            if (!prefix.empty()) out[prefix] = node.as<std::string>();
            break;
        default:
            break;
    }
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        const char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

} // namespace

Result<Values> EnvironmentConfigSource::load(const std::string&) const {
    Values out;
    for (char** env = environ; env && *env; ++env) {
        const std::string entry(*env);
        const auto pos = entry.find('=');
        if (pos == std::string::npos || pos == 0) continue;

        auto key = entry.substr(0, pos);
        if (!prefix_.empty()) {
            if (key.compare(0, prefix_.size(), prefix_) != 0 || key.size() == prefix_.size()) continue;
            key = key.substr(prefix_.size());
        }
        out[key] = entry.substr(pos + 1);
    }
    return Result<Values>::OK(std::move(out));
}

Result<Values> YamlConfigSource::load(const std::string&) const {
    std::ifstream file(path_);
    if (!file.good()) {
        LOG_DEBUG(TAG, "yaml source not found: {}", path_);
        return Result<Values>::OK(Values{});
    }

    Values out;
    try {
        flatten(YAML::LoadFile(path_), "", out);
    } catch (const YAML::Exception& e) {
        return Result<Values>::Error(ResultCode::InvalidArgument,
            "yaml source " + path_ + ": " + e.what());
    }
    return Result<Values>::OK(std::move(out));
}

const std::set<std::string>& EnvFileConfigSource::blockedKeys() {
    static const std::set<std::string> keys = {
        "GOOGLE_APPLICATION_CREDENTIALS",
        "GCLOUD_PROJECT",
        "GOOGLE_CLOUD_PROJECT",
        "GCLOUD_CONFIG",
        "CLOUDSDK_CONFIG",
    };
    return keys;
}

Result<Values> EnvFileConfigSource::load(const std::string&) const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        LOG_DEBUG(TAG, "env file not found: {}", path_);
        return Result<Values>::OK(Values{});
    }

    Values out;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto text = trim(line);
        if (text.empty() || text[0] == '#') continue;

        const auto pos = text.find('=');
        if (pos == std::string::npos) {
            LOG_WARN(TAG, "{}:{} ignored, no '='", path_, line_no);
            continue;
        }
        auto key = trim(text.substr(0, pos));
        if (key.compare(0, 7, "export ") == 0) key = trim(key.substr(7));
        if (key.empty()) continue;

        if (blockedKeys().count(key)) {
            LOG_WARN(TAG, "{}: dropped infrastructure credential key {}", path_, key);
            continue;
        }
        out[key] = unquote(trim(text.substr(pos + 1)));
    }
    if (in.bad()) {
        return Result<Values>::Error(ResultCode::InternalError, "read error: " + path_);
    }
    return Result<Values>::OK(std::move(out));
}

} // namespace config
