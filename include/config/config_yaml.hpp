#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace wtc::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<CoordinatorConfig> {
    static Node encode(const CoordinatorConfig& rhs) {
        Node node;
        node["acquire_timeout_seconds"] = rhs.acquire_timeout.count();
        node["stale_ttl_seconds"] = rhs.stale_ttl.count();
        node["aging_interval_seconds"] = rhs.aging_interval.count();
        node["reclaim_interval_seconds"] = rhs.reclaim_interval.count();
        node["retry_boost"] = rhs.retry_boost;
        node["worker_slots"] = rhs.worker_slots;
        return node;
    }

    static bool decode(const Node& node, CoordinatorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.acquire_timeout = std::chrono::seconds(node["acquire_timeout_seconds"].as<long>(30));
        rhs.stale_ttl = std::chrono::seconds(node["stale_ttl_seconds"].as<long>(30));
        rhs.aging_interval = std::chrono::seconds(node["aging_interval_seconds"].as<long>(5));
        rhs.reclaim_interval = std::chrono::seconds(node["reclaim_interval_seconds"].as<long>(5));
        rhs.retry_boost = node["retry_boost"].as<unsigned int>(2);
        rhs.worker_slots = node["worker_slots"].as<unsigned int>(16);
        return true;
    }
};

template<>
struct convert<BackoffConfig> {
    static Node encode(const BackoffConfig& rhs) {
        Node node;
        node["base_ms"] = rhs.base.count();
        node["factor"] = rhs.factor;
        node["cap_ms"] = rhs.cap.count();
        return node;
    }

    static bool decode(const Node& node, BackoffConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base = std::chrono::milliseconds(node["base_ms"].as<long>(100));
        rhs.factor = node["factor"].as<double>(2.0);
        rhs.cap = std::chrono::milliseconds(node["cap_ms"].as<long>(2000));
        return true;
    }
};

template<>
struct convert<PredictorConfig> {
    static Node encode(const PredictorConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["confidence_threshold"] = rhs.confidence_threshold;
        node["sequence_length"] = rhs.sequence_length;
        node["grace_window_ms"] = rhs.grace_window.count();
        node["patterns_file"] = rhs.patterns_file.string();
        return node;
    }

    static bool decode(const Node& node, PredictorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.confidence_threshold = node["confidence_threshold"].as<double>(0.70);
        rhs.sequence_length = node["sequence_length"].as<unsigned int>(2);
        rhs.grace_window = std::chrono::milliseconds(node["grace_window_ms"].as<long>(2000));
        rhs.patterns_file = node["patterns_file"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<MetricsConfig> {
    static Node encode(const MetricsConfig& rhs) {
        Node node;
        node["flush_interval_ms"] = rhs.flush_interval.count();
        node["retention_days"] = rhs.retention_days.count();
        node["log_file"] = rhs.log_file.string();
        node["summary_file"] = rhs.summary_file.string();
        return node;
    }

    static bool decode(const Node& node, MetricsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.flush_interval = std::chrono::milliseconds(node["flush_interval_ms"].as<long>(1000));
        rhs.retention_days = std::chrono::days(node["retention_days"].as<unsigned int>(7));
        rhs.log_file = node["log_file"].as<std::string>("");
        rhs.summary_file = node["summary_file"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["socket_path"] = rhs.socket_path.string();
        node["max_connections"] = rhs.max_connections;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.socket_path = node["socket_path"].as<std::string>("");
        rhs.max_connections = node["max_connections"].as<unsigned int>(64);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["wtc"]       = to_std_string(spdlog::level::to_string_view(rhs.wtc));
        node["registry"]  = to_std_string(spdlog::level::to_string_view(rhs.registry));
        node["scheduler"] = to_std_string(spdlog::level::to_string_view(rhs.scheduler));
        node["metrics"]   = to_std_string(spdlog::level::to_string_view(rhs.metrics));
        node["predictor"] = to_std_string(spdlog::level::to_string_view(rhs.predictor));
        node["ctl"]       = to_std_string(spdlog::level::to_string_view(rhs.ctl));
        node["client"]    = to_std_string(spdlog::level::to_string_view(rhs.client));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.wtc = spdlog::level::from_str(node["wtc"].as<std::string>("info"));
        rhs.registry = spdlog::level::from_str(node["registry"].as<std::string>("info"));
        rhs.scheduler = spdlog::level::from_str(node["scheduler"].as<std::string>("info"));
        rhs.metrics = spdlog::level::from_str(node["metrics"].as<std::string>("warn"));
        rhs.predictor = spdlog::level::from_str(node["predictor"].as<std::string>("info"));
        rhs.ctl = spdlog::level::from_str(node["ctl"].as<std::string>("warn"));
        rhs.client = spdlog::level::from_str(node["client"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
