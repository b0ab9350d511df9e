#include "log/Registry.hpp"

#include <filesystem>
#include <stdexcept>

namespace wtc::log {

void Registry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    if (!fs::exists(cfg.log_dir)) fs::create_directories(cfg.log_dir);
    main_log_path_ = cfg.log_dir / "wtcd.log";

    // console
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_color_mode(spdlog::color_mode::automatic);
    console->set_level(cfg.levels.console_log_level);
    console->set_pattern(LOG_FORMAT);
    console_sink_ = console;

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cfg.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    registerSubsystems(cfg.levels.subsystem_levels, {console_sink_, main_file_sink_});

    initialized_ = true;
    wtc()->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

void Registry::initConsole(const spdlog::level::level_enum level) {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(level);
    console_sink_->set_pattern(LOG_FORMAT);

    config::SubsystemLogLevelsConfig levels;
    levels.wtc = levels.registry = levels.scheduler = levels.metrics =
        levels.predictor = levels.ctl = levels.client = level;
    registerSubsystems(levels, {console_sink_});

    initialized_ = true;
}

void Registry::registerSubsystems(const config::SubsystemLogLevelsConfig& levels,
                                  const std::vector<spdlog::sink_ptr>& sinks) {
    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    makeLogger("wtc",       levels.wtc);
    makeLogger("registry",  levels.registry);
    makeLogger("scheduler", levels.scheduler);
    makeLogger("metrics",   levels.metrics);
    makeLogger("predictor", levels.predictor);
    makeLogger("ctl",       levels.ctl);
    makeLogger("client",    levels.client);
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::replaceSinkEverywhere_(
    const std::shared_ptr<spdlog::sinks::sink>& old_sink,
    const std::shared_ptr<spdlog::sinks::sink>& new_sink)
{
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        auto sinks_copy = lg->sinks();
        bool touched = false;
        for (auto &s : sinks_copy) {
            if (s.get() == old_sink.get()) {
                s = new_sink;
                touched = true;
            }
        }
        if (touched) {
            lg->flush();
            lg->sinks() = std::move(sinks_copy);
        }
    });
}

void Registry::reopenMainLog() {
    if (!initialized_ || !main_file_sink_) return;

    auto fresh = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);

    fresh->set_level(main_file_sink_->level());
    fresh->set_pattern(LOG_FORMAT);

    replaceSinkEverywhere_(main_file_sink_, fresh);
    main_file_sink_ = std::move(fresh);
}

}
