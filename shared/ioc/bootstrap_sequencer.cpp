#include "bootstrap_sequencer.hpp"

#include <set>
#include <unordered_map>
#include <fmt/format.h>

#include "logging/logging.hpp"

namespace ioc {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep = ", ") {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

void fail(UtilityStatus& status, FailureReason reason, std::string detail) {
    status.state = UtilityState::Failed;
    status.reason = reason;
    status.detail = std::move(detail);
}

} // namespace

std::vector<std::string> BootstrapResult::failed() const {
    std::vector<std::string> out;
    for (const auto& name : order) {
        auto it = states.find(name);
        if (it != states.end() && it->second.failed()) out.push_back(name);
    }
    return out;
}

Result<std::vector<std::string>> BootstrapSequencer::order(const std::vector<UtilityDescriptor>& descriptors)
{
    using Names = Result<std::vector<std::string>>;

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < descriptors.size(); ++i) {
        const auto& name = descriptors[i].name;
        if (name.empty()) {
            return Names::Error(ResultCode::InvalidArgument, fmt::format("descriptor #{} has no name", i));
        }
        if (!index.emplace(name, i).second) {
            return Names::Error(ResultCode::InvalidArgument, fmt::format("duplicate utility '{}'", name));
        }
    }

    // edges dependency -> dependent, declared names only
    std::vector<std::vector<size_t>> dependents(descriptors.size());
    std::vector<size_t> indegree(descriptors.size(), 0);
    for (size_t i = 0; i < descriptors.size(); ++i) {
        std::set<size_t> seen;
        for (const auto& dep : descriptors[i].dependencies) {
            auto it = index.find(dep);
            if (it == index.end() || !seen.insert(it->second).second) continue;
            dependents[it->second].push_back(i);
            ++indegree[i];
        }
    }

    std::set<size_t> ready;
    for (size_t i = 0; i < descriptors.size(); ++i) {
        if (indegree[i] == 0) ready.insert(i);
    }

    std::vector<std::string> sorted;
    sorted.reserve(descriptors.size());
    while (!ready.empty()) {
        const size_t current = *ready.begin();
        ready.erase(ready.begin());
        sorted.push_back(descriptors[current].name);
        for (size_t next : dependents[current]) {
            if (--indegree[next] == 0) ready.insert(next);
        }
    }

    if (sorted.size() == descriptors.size()) {
        return Names::OK(std::move(sorted));
    }

    // What is left sits on a cycle or downstream of one. Peel off the
    // downstream part so that only the cycle members are reported.
    std::set<size_t> remaining;
    for (size_t i = 0; i < descriptors.size(); ++i) {
        if (indegree[i] > 0) remaining.insert(i);
    }
    bool pruned = true;
    while (pruned) {
        pruned = false;
        for (auto it = remaining.begin(); it != remaining.end();) {
            bool feeds_remaining = false;
            for (size_t next : dependents[*it]) {
                if (remaining.count(next)) { feeds_remaining = true; break; }
            }
            if (!feeds_remaining) {
                it = remaining.erase(it);
                pruned = true;
            } else {
                ++it;
            }
        }
    }

    std::vector<std::string> members;
    for (size_t i : remaining) members.push_back(descriptors[i].name);
    LOG_ERROR(LOG_TAG, "dependency cycle: {}", join(members));
    return Names::Error(ResultCode::CyclicDependency, "dependency cycle: " + join(members));
}

config::ConfigurationSnapshot BootstrapSequencer::sliceFor_(const UtilityDescriptor& descriptor,
                                                            const config::ConfigurationSnapshot& snapshot)
{
    if (descriptor.full_configuration) return snapshot;
    return snapshot.slice(descriptor.config_keys, descriptor.config_prefix);
}

Result<BootstrapResult> BootstrapSequencer::bootstrap(const std::vector<UtilityDescriptor>& descriptors,
                                                      const config::ConfigurationSnapshot& snapshot,
                                                      task::Deadline deadline) const
{
    auto sorted = order(descriptors);
    if (!sorted) {
        return Result<BootstrapResult>::Error(sorted.code(), sorted.error());
    }

    std::unordered_map<std::string, const UtilityDescriptor*> by_name;
    for (const auto& descriptor : descriptors) by_name.emplace(descriptor.name, &descriptor);

    BootstrapResult result;
    result.order = sorted.value();
    result.registry = std::make_shared<UtilityRegistry>();
    for (const auto& name : result.order) result.states[name] = UtilityStatus{};

    const auto& service = snapshot.serviceName();

    for (const auto& name : result.order) {
        const auto& descriptor = *by_name.at(name);
        auto& status = result.states[name];

        if (task::expired(deadline)) {
            fail(status, FailureReason::Timeout, "bootstrap deadline exceeded");
            LOGW("[{}] {} not constructed: deadline exceeded", service, name);
            continue;
        }

        // -------------------------------
        // dependencies
        // -------------------------------
        std::map<std::string, UtilityHandle> handles;
        for (const auto& dep : descriptor.dependencies) {
            auto state = result.states.find(dep);
            if (state == result.states.end()) {
                fail(status, FailureReason::MissingDependency, fmt::format("undeclared dependency '{}'", dep));
                break;
            }
            if (!state->second.ready()) {
                fail(status, FailureReason::DependencyFailed,
                    fmt::format("dependency '{}' is {} ({})", dep,
                        to_string(state->second.state), to_string(state->second.reason)));
                break;
            }
            handles.emplace(dep, result.registry->find(dep));
        }
        if (status.failed()) {
            LOGW("[{}] {} skipped: {}", service, name, status.detail);
            continue;
        }

        // -------------------------------
        // configuration
        // -------------------------------
        auto slice = sliceFor_(descriptor, snapshot);
        auto valid = slice.validate(descriptor.config_keys);
        if (!valid) {
            fail(status, FailureReason::ConfigError, to_string(valid));
            LOGW("[{}] {} config rejected: {}", service, name, status.detail);
            continue;
        }

        if (!descriptor.factory) {
            fail(status, FailureReason::ConstructorFailed, "no factory");
            LOGE("[{}] {} has no factory", service, name);
            continue;
        }

        // -------------------------------
        // construction
        // -------------------------------
        status.state = UtilityState::Initializing;
        UtilityContext context(service, std::move(slice), std::move(handles));
        auto factory = descriptor.factory;
        auto built = task::runUntil<UtilityHandle>(
            [factory, context]() { return factory(context); }, deadline, name);

        if (!built) {
            const bool timed_out = built.code() == ResultCode::Timeout && task::expired(deadline);
            fail(status, timed_out ? FailureReason::Timeout : FailureReason::ConstructorFailed, to_string(built));
            LOGE("[{}] {} failed: {}", service, name, status.detail);
            continue;
        }
        if (!built.value()) {
            fail(status, FailureReason::ConstructorFailed, "factory returned no instance");
            LOGE("[{}] {} failed: {}", service, name, status.detail);
            continue;
        }
        if (!result.registry->add(name, built.value())) {
            fail(status, FailureReason::ConstructorFailed, "rejected by registry");
            LOGE("[{}] {} failed: {}", service, name, status.detail);
            continue;
        }

        status.state = UtilityState::Ready;
        LOGI("[{}] {} ready", service, name);
    }

    result.registry->freeze();
    return Result<BootstrapResult>::OK(std::move(result));
}

} // namespace ioc
