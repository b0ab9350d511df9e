#include "client/Client.hpp"
#include "config/ConfigRegistry.hpp"
#include "coord/errors.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

extern char** environ;

using namespace wtc;
using namespace wtc::types;

namespace {

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_TIMEOUT = 1,
    EXIT_UNAVAILABLE = 2,
    EXIT_CANCELLED = 3,
    EXIT_CONFLICT = 4,
    EXIT_COMMAND_FAILED = 5,
    EXIT_USAGE = 64
};

void usage(std::FILE* out) {
    fmt::print(out,
               "usage: wtcctl run [--priority N] [--target ID] [--caller ID] [--timeout S] <verb> [-- cmd args...]\n"
               "       wtcctl cancel <id>\n"
               "       wtcctl summary\n"
               "       wtcctl status\n"
               "       wtcctl reclaim\n"
               "\n"
               "run executes 'git <verb>' unless a command follows '--'. The target defaults to\n"
               "$WTC_WORKTREE, else the worktree containing the current directory. --timeout\n"
               "bounds each acquisition attempt, with or without a coordinator.\n"
               "exit codes: 0 ok, 1 timeout, 2 coordinator unavailable, 3 cancelled,\n"
               "            4 scope conflict, 5 command failed, 64 usage\n");
}

struct RunArgs {
    std::string verb, target, caller;
    int priority = 5;
    std::optional<long> timeoutSeconds;
    std::vector<std::string> command;
};

std::optional<RunArgs> parseRun(const std::vector<std::string>& args) {
    RunArgs r;
    size_t i = 0;
    auto value = [&](const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= args.size()) {
            fmt::print(stderr, "wtcctl: {} needs a value\n", flag);
            return std::nullopt;
        }
        return args[++i];
    };

    try {
        for (; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "--priority") {
                const auto v = value(a);
                if (!v) return std::nullopt;
                r.priority = std::stoi(*v);
            } else if (a == "--target") {
                const auto v = value(a);
                if (!v) return std::nullopt;
                r.target = *v;
            } else if (a == "--caller") {
                const auto v = value(a);
                if (!v) return std::nullopt;
                r.caller = *v;
            } else if (a == "--timeout") {
                const auto v = value(a);
                if (!v) return std::nullopt;
                r.timeoutSeconds = std::stol(*v);
            } else if (a == "--") {
                r.command.assign(args.begin() + static_cast<long>(i) + 1, args.end());
                break;
            } else if (a.starts_with("--")) {
                fmt::print(stderr, "wtcctl: unknown option {}\n", a);
                return std::nullopt;
            } else if (r.verb.empty()) {
                r.verb = a;
            } else {
                fmt::print(stderr, "wtcctl: unexpected argument {}\n", a);
                return std::nullopt;
            }
        }
    } catch (const std::logic_error&) {
        fmt::print(stderr, "wtcctl: invalid number for {}\n", args[i - 1]);
        return std::nullopt;
    }

    if (r.verb.empty()) return std::nullopt;
    if (r.command.empty()) r.command = {"git", r.verb};
    if (r.target.empty()) r.target = paths::getWorktreeId();
    if (r.caller.empty()) r.caller = paths::envOr("WTC_CALLER_ID", "pid:" + std::to_string(::getppid()));
    return r;
}

// Runs argv in the foreground; returns its exit status (128+N when killed by signal N).
int runCommand(const std::vector<std::string>& argv) {
    std::vector<char*> cargs;
    for (const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);

    pid_t pid = 0;
    if (const int rc = ::posix_spawnp(&pid, cargs[0], nullptr, nullptr, cargs.data(), environ); rc != 0) {
        fmt::print(stderr, "wtcctl: cannot run {}: {}\n", argv[0], std::strerror(rc));
        return 127;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return 127;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

int exitCodeFor(const OperationResult& r) {
    switch (r.status) {
        case OperationResult::Status::Success: return r.exit_code == 0 ? EXIT_OK : EXIT_COMMAND_FAILED;
        case OperationResult::Status::Timeout: return EXIT_TIMEOUT;
        case OperationResult::Status::Unavailable: return EXIT_UNAVAILABLE;
        case OperationResult::Status::Cancelled: return EXIT_CANCELLED;
        case OperationResult::Status::Conflict: return EXIT_CONFLICT;
        default: return EXIT_UNAVAILABLE;
    }
}

int cmdRun(const client::Client& client, const RunArgs& args) {
    auto request = makeRequest(args.verb, args.target, args.priority, args.caller, ::getpid());
    if (args.timeoutSeconds) request.acquire_timeout = std::chrono::seconds(*args.timeoutSeconds);
    const auto result = client.submit(request, [&] { return runCommand(args.command); });

    if (!result.ok()) {
        fmt::print(stderr, "wtcctl: {} '{}' on {}: {}\n", to_string(result.status), args.verb, result.scope_used,
                   result.message.empty() ? "no further detail" : result.message);
        if (!result.holder.empty())
            fmt::print(stderr, "wtcctl: held by {} (waited {} ms)\n", result.holder, result.waited_ms);
    } else if (result.degraded) {
        fmt::print(stderr, "wtcctl: coordinator not running, used direct locks\n");
    }
    return exitCodeFor(result);
}

}

int main(const int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        usage(args.empty() ? stderr : stdout);
        return args.empty() ? EXIT_USAGE : EXIT_OK;
    }

    try {
        log::Registry::initConsole(spdlog::level::from_str(paths::envOr("WTC_LOG_LEVEL", "warn")));
        config::ConfigRegistry::init();
        auto opts = client::ClientOptions::fromConfig(config::ConfigRegistry::get());

        const auto cmd = args[0];
        const std::vector<std::string> rest(args.begin() + 1, args.end());

        if (cmd == "run") {
            const auto run = parseRun(rest);
            if (!run) {
                usage(stderr);
                return EXIT_USAGE;
            }
            return cmdRun(client::Client(opts), *run);
        }

        opts.allow_degraded = false;
        const client::Client client(opts);

        if (cmd == "cancel" && rest.size() == 1) {
            if (client.cancel(rest[0])) return EXIT_OK;
            fmt::print(stderr, "wtcctl: {} is not queued\n", rest[0]);
            return EXIT_FAILURE;
        }
        if (cmd == "summary" && rest.empty()) {
            fmt::print("{}\n", client.summary().dump(2));
            return EXIT_OK;
        }
        if (cmd == "status" && rest.empty()) {
            fmt::print("{}\n", client.status().dump(2));
            return EXIT_OK;
        }
        if (cmd == "reclaim" && rest.empty()) {
            fmt::print("reclaimed {} stale lock(s)\n", client.reclaim());
            return EXIT_OK;
        }

        usage(stderr);
        return EXIT_USAGE;
    } catch (const coord::SchedulerUnavailable& e) {
        fmt::print(stderr, "wtcctl: coordinator unavailable: {}\n", e.what());
        return EXIT_UNAVAILABLE;
    } catch (const std::exception& e) {
        fmt::print(stderr, "wtcctl: {}\n", e.what());
        return EXIT_UNAVAILABLE;
    }
}
