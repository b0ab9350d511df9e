#include "config/ConfigRegistry.hpp"
#include "services/ServiceManager.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>
#include <fmt/core.h>

using namespace wtc;
using namespace wtc::config;
using namespace wtc::services;

namespace {

std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

void usage(std::FILE* out) {
    fmt::print(out, "usage: wtcd [--config PATH]\n");
}

}

int main(const int argc, char** argv) {
    std::filesystem::path configPath = paths::getConfigPath();

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(stdout);
            return EXIT_SUCCESS;
        }
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
            continue;
        }
        usage(stderr);
        return 64;
    }

    try {
        ConfigRegistry::init(configPath);
        const auto& cfg = ConfigRegistry::get();
        log::Registry::init(cfg.logging);

        log::Registry::wtc()->info("[*] Starting worktree coordinator (state dir {}, {} worker slots)",
                                   cfg.state_dir.string(), cfg.coordinator.worker_slots);

        ServiceManager manager(cfg);
        manager.startAll();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);
        std::signal(SIGPIPE, SIG_IGN);

        log::Registry::wtc()->info("[✓] Coordinator listening on {}", cfg.server.socket_path.string());

        while (!shouldExit) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            if (reopenLogs.exchange(false)) {
                log::Registry::reopenMainLog();
                log::Registry::wtc()->info("[*] Reopened log files");
            }
        }

        log::Registry::wtc()->info("[*] Shutting down coordinator...");
        manager.stopAll();
        log::Registry::wtc()->info("[✓] Coordinator shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::wtc()->error("[-] Coordinator failed: {}", e.what());
        else fmt::print(stderr, "wtcd: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
