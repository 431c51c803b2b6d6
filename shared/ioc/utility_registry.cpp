#include "utility_registry.hpp"

#include "logging/logging.hpp"

namespace ioc {

bool UtilityRegistry::add(const std::string& name, UtilityHandle utility)
{
    if (!utility || name.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen()) {
        LOGW("registry frozen, rejected: {}", name);
        return false;
    }

    auto [it, inserted] = utilities_.try_emplace(name, std::move(utility));
    if (!inserted) {
        // duplicate
        return false;
    }
    order_.push_back(name);
    return true;
}

UtilityHandle UtilityRegistry::find(const std::string& name) const
{
    if (frozen()) {
        auto it = utilities_.find(name);
        return it == utilities_.end() ? nullptr : it->second;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = utilities_.find(name);
    return it == utilities_.end() ? nullptr : it->second;
}

std::vector<std::string> UtilityRegistry::names() const
{
    if (frozen()) return order_;
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t UtilityRegistry::size() const
{
    if (frozen()) return order_.size();
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

size_t UtilityRegistry::releaseAll(std::chrono::milliseconds budget, task::Deadline deadline)
{
    if (released_.exchange(true)) return 0;
    freeze();

    size_t errors = 0;
    for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
        const auto& name = *it;
        auto utility = utilities_.at(name);

        const auto until = task::earliest(task::deadlineAfter(budget), deadline);
        auto res = task::runUntil<bool>([utility]() -> Result<bool> {
            auto down = utility->shutdown();
            if (!down) return down;
            return Result<bool>::OK(true);
        }, until, "shutdown " + name);

        if (!res) {
            ++errors;
            LOGE("utility {} teardown failed: {}", name, to_string(res));
            continue;
        }
        LOGD("utility {} released", name);
    }
    return errors;
}

} // namespace ioc
