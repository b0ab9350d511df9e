#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace wtc::config {

struct CoordinatorConfig {
    std::chrono::seconds acquire_timeout{30};
    std::chrono::seconds stale_ttl{30};      // must exceed the longest legitimate operation
    std::chrono::seconds aging_interval{5};
    std::chrono::seconds reclaim_interval{5};
    unsigned int retry_boost = 2;
    unsigned int worker_slots = 16;
};

struct BackoffConfig {
    std::chrono::milliseconds base{100};
    double factor = 2.0;
    std::chrono::milliseconds cap{2000};
};

struct PredictorConfig {
    bool enabled = true;
    double confidence_threshold = 0.70;
    unsigned int sequence_length = 2;
    std::chrono::milliseconds grace_window{2000};
    std::filesystem::path patterns_file;    // empty = <state_dir>/patterns.log
};

struct MetricsConfig {
    std::chrono::milliseconds flush_interval{1000};
    std::chrono::days retention_days{7};
    std::filesystem::path log_file;         // empty = <state_dir>/metrics.csv
    std::filesystem::path summary_file;     // empty = <state_dir>/metrics-summary.json
};

struct ServerConfig {
    std::filesystem::path socket_path;      // empty = <state_dir>/coordinator.sock
    unsigned int max_connections = 64;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum wtc        = spdlog::level::info;   // startup/shutdown
    spdlog::level::level_enum registry   = spdlog::level::info;   // acquisitions, drains, reclaims
    spdlog::level::level_enum scheduler  = spdlog::level::info;
    spdlog::level::level_enum metrics    = spdlog::level::warn;   // only storage failures
    spdlog::level::level_enum predictor  = spdlog::level::info;
    spdlog::level::level_enum ctl        = spdlog::level::warn;   // malformed frames, dropped clients
    spdlog::level::level_enum client     = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;          // empty = <state_dir>/logs
    LogLevelsConfig levels;
};

struct Config {
    std::filesystem::path state_dir = ".git/wtc";
    CoordinatorConfig coordinator;
    BackoffConfig backoff;
    PredictorConfig predictor;
    MetricsConfig metrics;
    ServerConfig server;
    LoggingConfig logging;

    // Fills empty paths relative to state_dir.
    void resolvePaths();
};

// Defaults, then the YAML file (if it exists), then WTC_* environment overrides.
Config loadConfig(const std::filesystem::path& path);
void applyEnvOverrides(Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const CoordinatorConfig& c);
void to_json(nlohmann::json& j, const BackoffConfig& c);
void to_json(nlohmann::json& j, const PredictorConfig& c);
void to_json(nlohmann::json& j, const MetricsConfig& c);
void to_json(nlohmann::json& j, const ServerConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace wtc::config
