#include "client/DirectLock.hpp"
#include "coord/Backoff.hpp"
#include "coord/errors.hpp"
#include "types/Operation.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using namespace wtc::client;
using namespace wtc::types;
using namespace std::chrono;

namespace {

// true when taken, false when busy
bool tryFlock(const int fd, const int op) {
    while (::flock(fd, op | LOCK_NB) != 0) {
        if (errno == EINTR) continue;
        if (errno == EWOULDBLOCK) return false;
        throw std::system_error(errno, std::generic_category(), "flock");
    }
    return true;
}

void closeFd(int& fd) {
    if (fd < 0) return;
    ::flock(fd, LOCK_UN);
    ::close(fd);
    fd = -1;
}

}

DirectLock::DirectLock(std::filesystem::path lockDir, const config::BackoffConfig& backoff)
    : lockDir_(std::move(lockDir)), backoff_(backoff) {}

DirectLock::~DirectLock() { release(); }

std::filesystem::path DirectLock::lockFileFor(const std::filesystem::path& lockDir, const ScopeRequirement& scope) {
    if (scope.isGlobal()) return lockDir / "global.lock";

    std::string safe = scope.worktree;
    std::ranges::replace_if(safe, [](const unsigned char c) {
        return !std::isalnum(c) && c != '-' && c != '_' && c != '.';
    }, '_');
    return lockDir / ("worktree-" + safe + ".lock");
}

int DirectLock::openLockFile(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "open " + path.string());
    return fd;
}

void DirectLock::acquire(const ScopeRequirement& scope, const milliseconds timeout) {
    if (held()) throw std::logic_error("DirectLock already held");

    std::filesystem::create_directories(lockDir_);
    int globalFd = openLockFile(lockFileFor(lockDir_, ScopeRequirement::global()));
    int worktreeFd = scope.isGlobal() ? -1 : openLockFile(lockFileFor(lockDir_, scope));

    const auto start = Clock::now();
    const auto deadline = start + timeout;
    coord::Backoff backoff(backoff_);

    try {
        while (true) {
            bool ok = tryFlock(globalFd, scope.isGlobal() ? LOCK_EX : LOCK_SH);
            if (ok && worktreeFd >= 0) {
                ok = tryFlock(worktreeFd, LOCK_EX);
                if (!ok) ::flock(globalFd, LOCK_UN);
            }
            if (ok) break;

            const auto now = Clock::now();
            if (now >= deadline) {
                closeFd(worktreeFd);
                closeFd(globalFd);
                throw coord::AcquisitionTimeout(scope.id(), "another process (direct lock)",
                                                static_cast<uint64_t>(duration_cast<milliseconds>(now - start).count()));
            }
            std::this_thread::sleep_for(std::min<Clock::duration>(backoff.next(), deadline - now));
        }
    } catch (const std::system_error&) {
        closeFd(worktreeFd);
        closeFd(globalFd);
        throw;
    }

    globalFd_ = globalFd;
    worktreeFd_ = worktreeFd;
    log::Registry::client()->debug("[DirectLock] Took {} under {}", scope.id(), lockDir_.string());
}

void DirectLock::release() {
    closeFd(worktreeFd_);
    closeFd(globalFd_);
}
