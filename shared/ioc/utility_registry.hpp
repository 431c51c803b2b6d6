#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "task/deadline_task.hpp"
#include "utility.hpp"

namespace ioc {

// Holds the Ready utilities of one container generation.
//
// Utilities are added once per name during bootstrap. After freeze() the map
// is never mutated again, so lookups from request threads take no lock.
// releaseAll() shuts utilities down in reverse insertion order but keeps the
// handles; they go away with the registry itself.
class UtilityRegistry
{
public:
    inline static constexpr const char* LOG_TAG = "UtilityRegistry";

    UtilityRegistry() noexcept : frozen_(false), released_(false) {}
    ~UtilityRegistry() = default;

    UtilityRegistry(const UtilityRegistry&) = delete;
    UtilityRegistry& operator=(const UtilityRegistry&) = delete;

    // false on null handle, duplicate name or frozen registry
    bool add(const std::string& name, UtilityHandle utility);

    UtilityHandle find(const std::string& name) const;

    template<typename T>
    std::shared_ptr<T> find(const std::string& name) const {
        return std::dynamic_pointer_cast<T>(find(name));
    }

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // insertion (construction) order
    std::vector<std::string> names() const;
    size_t size() const;

    void freeze() noexcept { frozen_.store(true, std::memory_order_release); }
    bool frozen() const noexcept { return frozen_.load(std::memory_order_acquire); }

    // Each utility gets at most `budget`, bounded by `deadline`. Errors and
    // timeouts are logged and counted, never propagated. Runs once.
    size_t releaseAll(std::chrono::milliseconds budget, task::Deadline deadline = task::noDeadline());

private:
    std::unordered_map<std::string, UtilityHandle> utilities_;
    std::vector<std::string> order_;

    mutable std::mutex mutex_;
    std::atomic<bool> frozen_;
    std::atomic<bool> released_;
}; // class UtilityRegistry

} // namespace ioc
