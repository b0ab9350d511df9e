#pragma once

#include <string>
#include <string_view>

namespace wtc::types {

inline constexpr std::string_view GLOBAL_SCOPE = "global";
inline constexpr std::string_view WORKTREE_PREFIX = "worktree:";

struct ScopeRequirement {
    enum class Kind { Global, Worktree };

    Kind kind{Kind::Global};
    std::string worktree;   // empty for Global

    static ScopeRequirement global() { return {}; }
    static ScopeRequirement forWorktree(std::string id) { return {Kind::Worktree, std::move(id)}; }

    [[nodiscard]] bool isGlobal() const noexcept { return kind == Kind::Global; }

    // "global" or "worktree:<id>"
    [[nodiscard]] std::string id() const;

    bool operator==(const ScopeRequirement&) const = default;
};

bool isGlobalScopeId(std::string_view scopeId);

// "global" or "worktree", used to bucket metrics.
std::string scopeType(std::string_view scopeId);

ScopeRequirement parseScopeId(std::string_view scopeId);

}
