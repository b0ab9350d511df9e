#include "coord/ScopeResolver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <vector>

using namespace wtc::coord;
using namespace wtc::types;

namespace {

constexpr std::array<std::string_view, 14> kGlobalVerbs = {
    "merge", "pull", "fetch", "push", "worktree", "gc", "prune", "repack",
    "pack-refs", "update-ref", "tag", "remote", "stash", "symbolic-ref"
};

constexpr std::array<std::string_view, 19> kWorktreeVerbs = {
    "add", "commit", "status", "diff", "checkout", "switch", "restore", "reset",
    "rm", "mv", "log", "show", "blame", "rebase", "cherry-pick", "revert",
    "clean", "grep", "apply"
};

constexpr std::array<std::string_view, 7> kBranchMutations = {
    "-m", "-M", "-d", "-D", "--move", "--delete", "rename"
};

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

std::vector<std::string> tokens(std::string_view verb) {
    std::vector<std::string> out;
    std::istringstream ss{std::string(verb)};
    for (std::string t; ss >> t;) out.push_back(std::move(t));
    return out;
}

template <size_t N>
bool contains(const std::array<std::string_view, N>& table, const std::string_view v) {
    return std::ranges::find(table, v) != table.end();
}

}

std::string ScopeResolver::command(const std::string_view verb) {
    const auto toks = tokens(verb);
    if (toks.empty()) return {};
    auto cmd = lower(toks.front());
    if (contains(kGlobalVerbs, cmd) || contains(kWorktreeVerbs, cmd) || cmd == "branch") return cmd;

    // "worktree-add", "branch-rename": keep the command word
    if (const auto dash = cmd.find('-'); dash != std::string::npos) {
        auto head = cmd.substr(0, dash);
        if (head == "branch" || head == "worktree") return head;
    }
    return cmd;
}

ScopeRequirement ScopeResolver::resolve(const std::string_view verb, const std::string_view target) {
    const auto toks = tokens(verb);
    if (toks.empty()) return ScopeRequirement::global();

    const auto cmd = command(verb);
    const auto first = lower(toks.front());

    if (contains(kGlobalVerbs, cmd)) return ScopeRequirement::global();

    if (cmd == "branch") {
        // hyphenated alias ("branch-rename") or flags after the command word
        if (first != "branch") return ScopeRequirement::global();
        for (size_t i = 1; i < toks.size(); ++i)
            if (contains(kBranchMutations, toks[i])) return ScopeRequirement::global();
    } else if (!contains(kWorktreeVerbs, cmd)) {
        return ScopeRequirement::global();
    }

    if (target.empty()) return ScopeRequirement::global();
    return ScopeRequirement::forWorktree(std::string(target));
}
