#include "types/Scope.hpp"

#include <stdexcept>

using namespace wtc::types;

std::string ScopeRequirement::id() const {
    if (isGlobal()) return std::string(GLOBAL_SCOPE);
    return std::string(WORKTREE_PREFIX) + worktree;
}

bool wtc::types::isGlobalScopeId(const std::string_view scopeId) {
    return scopeId == GLOBAL_SCOPE;
}

std::string wtc::types::scopeType(const std::string_view scopeId) {
    return isGlobalScopeId(scopeId) ? "global" : "worktree";
}

ScopeRequirement wtc::types::parseScopeId(const std::string_view scopeId) {
    if (scopeId == GLOBAL_SCOPE) return ScopeRequirement::global();
    if (scopeId.starts_with(WORKTREE_PREFIX) && scopeId.size() > WORKTREE_PREFIX.size())
        return ScopeRequirement::forWorktree(std::string(scopeId.substr(WORKTREE_PREFIX.size())));
    throw std::invalid_argument("Invalid scope id: " + std::string(scopeId));
}
