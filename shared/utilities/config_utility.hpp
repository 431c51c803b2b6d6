#pragma once
#include <string>
#include <vector>

#include "config/configuration_snapshot.hpp"
#include "ioc/utility.hpp"

namespace utilities {

// Read access to the whole snapshot of the current generation.
class ConfigUtility : public ioc::Utility {
public:
    inline static constexpr const char* NAME = "config";

    explicit ConfigUtility(config::ConfigurationSnapshot snapshot) : snapshot_(std::move(snapshot)) {}

    static ioc::UtilityDescriptor descriptor();

    std::string name() const override { return NAME; }

    const config::ConfigurationSnapshot& snapshot() const noexcept { return snapshot_; }
    config::Environment environment() const noexcept { return snapshot_.environment(); }

    std::string getString(const std::string& key, const std::string& fallback = "") const {
        return snapshot_.getString(key, fallback);
    }
    int64_t getInt(const std::string& key, int64_t fallback) const { return snapshot_.getInt(key, fallback); }
    bool getBool(const std::string& key, bool fallback) const { return snapshot_.getBool(key, fallback); }

    // {valid, missing, invalid} for an ad hoc key set
    config::ValidationReport validate(const std::vector<config::ConfigKey>& keys) const {
        return snapshot_.report(keys);
    }

private:
    config::ConfigurationSnapshot snapshot_;
};

} // namespace utilities
