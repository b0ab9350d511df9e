#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <type_traits>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace wtc::config {

namespace {

template <typename T>
bool envNumber(const char* name, T& out) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return false;
    try {
        if constexpr (std::is_floating_point_v<T>) out = static_cast<T>(std::stod(raw));
        else out = static_cast<T>(std::stoll(raw));
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid numeric value for ") + name + ": " + raw);
    }
    return true;
}

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}

void Config::resolvePaths() {
    if (server.socket_path.empty()) server.socket_path = state_dir / "coordinator.sock";
    if (predictor.patterns_file.empty()) predictor.patterns_file = state_dir / "patterns.log";
    if (metrics.log_file.empty()) metrics.log_file = state_dir / "metrics.csv";
    if (metrics.summary_file.empty()) metrics.summary_file = state_dir / "metrics-summary.json";
    if (logging.log_dir.empty()) logging.log_dir = state_dir / "logs";
}

void applyEnvOverrides(Config& cfg) {
    if (const char* dir = std::getenv("WTC_STATE_DIR"); dir && *dir) cfg.state_dir = dir;
    if (const char* sock = std::getenv("WTC_SOCKET_PATH"); sock && *sock) cfg.server.socket_path = sock;

    long seconds = 0;
    if (envNumber("WTC_ACQUIRE_TIMEOUT_S", seconds)) cfg.coordinator.acquire_timeout = std::chrono::seconds(seconds);
    if (envNumber("WTC_STALE_TTL_S", seconds)) cfg.coordinator.stale_ttl = std::chrono::seconds(seconds);
    if (envNumber("WTC_AGING_INTERVAL_S", seconds)) cfg.coordinator.aging_interval = std::chrono::seconds(seconds);

    unsigned int slots = 0;
    if (envNumber("WTC_WORKER_SLOTS", slots)) cfg.coordinator.worker_slots = slots;

    double confidence = 0.0;
    if (envNumber("WTC_PREDICT_CONFIDENCE", confidence)) cfg.predictor.confidence_threshold = confidence;

    unsigned int seqLen = 0;
    if (envNumber("WTC_PREDICT_SEQUENCE_LEN", seqLen)) cfg.predictor.sequence_length = seqLen;

    if (const char* lvl = std::getenv("WTC_LOG_LEVEL"); lvl && *lvl)
        cfg.logging.levels.console_log_level = spdlog::level::from_str(lvl);

    if (cfg.coordinator.aging_interval.count() <= 0)
        throw std::invalid_argument("aging interval must be positive");
    if (cfg.coordinator.worker_slots == 0)
        throw std::invalid_argument("worker_slots must be at least 1");
    if (cfg.predictor.sequence_length == 0)
        throw std::invalid_argument("predictor sequence length must be at least 1");
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    if (!path.empty() && std::filesystem::exists(path)) {
        YAML::Node root = YAML::LoadFile(path.string());

        if (auto node = root["state_dir"]) cfg.state_dir = node.as<std::string>();
        if (auto node = root["coordinator"]) YAML::convert<CoordinatorConfig>::decode(node, cfg.coordinator);
        if (auto node = root["backoff"]) YAML::convert<BackoffConfig>::decode(node, cfg.backoff);
        if (auto node = root["predictor"]) YAML::convert<PredictorConfig>::decode(node, cfg.predictor);
        if (auto node = root["metrics"]) YAML::convert<MetricsConfig>::decode(node, cfg.metrics);
        if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    }

    applyEnvOverrides(cfg);
    cfg.resolvePaths();
    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"state_dir", c.state_dir.string()},
        {"coordinator", c.coordinator},
        {"backoff", c.backoff},
        {"predictor", c.predictor},
        {"metrics", c.metrics},
        {"server", c.server},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const CoordinatorConfig& c) {
    j = {
        {"acquire_timeout_seconds", c.acquire_timeout.count()},
        {"stale_ttl_seconds", c.stale_ttl.count()},
        {"aging_interval_seconds", c.aging_interval.count()},
        {"reclaim_interval_seconds", c.reclaim_interval.count()},
        {"retry_boost", c.retry_boost},
        {"worker_slots", c.worker_slots}
    };
}

void to_json(nlohmann::json& j, const BackoffConfig& c) {
    j = {
        {"base_ms", c.base.count()},
        {"factor", c.factor},
        {"cap_ms", c.cap.count()}
    };
}

void to_json(nlohmann::json& j, const PredictorConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"confidence_threshold", c.confidence_threshold},
        {"sequence_length", c.sequence_length},
        {"grace_window_ms", c.grace_window.count()},
        {"patterns_file", c.patterns_file.string()}
    };
}

void to_json(nlohmann::json& j, const MetricsConfig& c) {
    j = {
        {"flush_interval_ms", c.flush_interval.count()},
        {"retention_days", c.retention_days.count()},
        {"log_file", c.log_file.string()},
        {"summary_file", c.summary_file.string()}
    };
}

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = {
        {"socket_path", c.socket_path.string()},
        {"max_connections", c.max_connections}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", levelName(c.levels.console_log_level)},
        {"file_log_level", levelName(c.levels.file_log_level)}
    };
}

} // namespace wtc::config
