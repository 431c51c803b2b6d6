#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/result.h"
#include "config/configuration_snapshot.hpp"
#include "task/deadline_task.hpp"
#include "utility.hpp"
#include "utility_registry.hpp"

namespace ioc {

struct BootstrapResult {
    // topological construction order
    std::vector<std::string> order;
    std::map<std::string, UtilityStatus> states;
    // Ready utilities only, frozen
    std::shared_ptr<UtilityRegistry> registry;

    std::vector<std::string> failed() const;
    bool degraded() const { return !failed().empty(); }
};

// Brings a descriptor set from Pending to Ready/Failed in dependency order.
//
// A graph with a cycle or duplicate names is rejected before anything is
// constructed. Otherwise a failing utility only takes down its own
// dependents; independent branches keep going.
class BootstrapSequencer {
public:
    inline static constexpr const char* LOG_TAG = "BootstrapSequencer";

    // Kahn's algorithm; ties resolved by declaration order. Dependencies on
    // names that are not declared do not constrain the order.
    static Result<std::vector<std::string>> order(const std::vector<UtilityDescriptor>& descriptors);

    Result<BootstrapResult> bootstrap(const std::vector<UtilityDescriptor>& descriptors,
                                      const config::ConfigurationSnapshot& snapshot,
                                      task::Deadline deadline = task::noDeadline()) const;

private:
    static config::ConfigurationSnapshot sliceFor_(const UtilityDescriptor& descriptor,
                                                   const config::ConfigurationSnapshot& snapshot);
};

} // namespace ioc
