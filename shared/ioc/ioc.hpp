#pragma once

#include "bootstrap_sequencer.hpp"
#include "di_container.hpp"
#include "utility.hpp"
#include "utility_registry.hpp"

namespace ioc {

// Resolves a typed utility or yields nullptr, for call sites that treat an
// unavailable utility as degraded mode.
template <typename T>
inline std::shared_ptr<T> tryGetUtility(const DIContainer& container, const std::string& name)
{
    auto utility = container.getUtility<T>(name);
    return utility ? utility.value() : nullptr;
}

} // namespace ioc
