#include "coord/errors.hpp"

#include <fmt/format.h>

using namespace wtc::coord;

AcquisitionTimeout::AcquisitionTimeout(std::string scope, std::string holder, const uint64_t waitedMs)
    : std::runtime_error(fmt::format("scope '{}' still held by '{}' after {} ms",
                                     scope, holder.empty() ? "<draining>" : holder, waitedMs)),
      scope_(std::move(scope)), holder_(std::move(holder)), waitedMs_(waitedMs) {}

ScopeConflictDetected::ScopeConflictDetected(std::string requested, std::string held)
    : std::runtime_error(fmt::format("cannot acquire '{}' while holding '{}'", requested, held)),
      requested_(std::move(requested)), held_(std::move(held)) {}
