#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace wtc::log {

class Registry {
public:
    // Console + rotating file sinks under cfg.log_dir, levels per subsystem.
    static void init(const config::LoggingConfig& cfg);

    // stderr only; used by the CLI and the test runner so stdout stays clean.
    static void initConsole(spdlog::level::level_enum level = spdlog::level::warn);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> wtc()        { return get("wtc"); }
    static std::shared_ptr<spdlog::logger> registry()   { return get("registry"); }
    static std::shared_ptr<spdlog::logger> scheduler()  { return get("scheduler"); }
    static std::shared_ptr<spdlog::logger> metrics()    { return get("metrics"); }
    static std::shared_ptr<spdlog::logger> predictor()  { return get("predictor"); }
    static std::shared_ptr<spdlog::logger> ctl()        { return get("ctl"); }
    static std::shared_ptr<spdlog::logger> client()     { return get("client"); }

    [[nodiscard]] static bool isInitialized();

    static void reopenMainLog();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    // keep the shared sinks so we can swap them later
    static inline spdlog::sink_ptr console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void registerSubsystems(const config::SubsystemLogLevelsConfig& levels,
                                   const std::vector<spdlog::sink_ptr>& sinks);

    static void replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                       const std::shared_ptr<spdlog::sinks::sink>& new_sink);
};

}
