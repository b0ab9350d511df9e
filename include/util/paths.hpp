#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace wtc::paths {

inline std::string envOr(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    return v && *v ? std::string(v) : def;
}

// Per-repository state lives next to the shared git metadata.
inline std::filesystem::path getStateDir() {
    return envOr("WTC_STATE_DIR", ".git/wtc");
}

inline std::filesystem::path getConfigPath() {
    return envOr("WTC_CONFIG", (getStateDir() / "config.yaml").string());
}

inline std::filesystem::path getSocketPath() {
    return envOr("WTC_SOCKET_PATH", (getStateDir() / "coordinator.sock").string());
}

inline std::filesystem::path getLogPath() { return getStateDir() / "logs"; }

inline std::filesystem::path getLockDir() { return getStateDir() / "locks"; }

// Name of the worktree enclosing dir: the nearest ancestor with a .git entry
// (a directory in the main worktree, a file in linked ones), else dir itself.
inline std::string worktreeIdFor(const std::filesystem::path& dir) {
    std::error_code ec;
    auto abs = std::filesystem::weakly_canonical(dir, ec);
    if (ec) abs = std::filesystem::absolute(dir);

    for (auto p = abs; !p.empty(); p = p.parent_path()) {
        if (std::filesystem::exists(p / ".git", ec)) return p.filename().string();
        if (p == p.root_path()) break;
    }
    return abs.filename().string();
}

// WTC_WORKTREE wins over discovery from the working directory.
inline std::string getWorktreeId() {
    if (const char* v = std::getenv("WTC_WORKTREE"); v && *v) return v;
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string{} : worktreeIdFor(cwd);
}

}
