#pragma once

#include "types/Scope.hpp"

#include <string>
#include <string_view>

namespace wtc::coord {

/**
 * Maps a version-control verb to the lock scope it needs.
 *
 * Verbs that move shared refs (merges, fetch/pull/push, ref renames, worktree
 * list changes, stash) need the global scope. Verbs confined to one worktree's
 * index and working tree need that worktree's scope. Anything unrecognized,
 * or a worktree verb without a target, falls back to global.
 */
class ScopeResolver {
public:
    static types::ScopeRequirement resolve(std::string_view verb, std::string_view target);

    // Lower-cased command word with hyphenated aliases split off, e.g. "branch-rename" -> "branch".
    static std::string command(std::string_view verb);
};

}
