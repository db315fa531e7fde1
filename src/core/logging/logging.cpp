#include "core/logging.hpp"

#include <system_error>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sweep_recon::logging {

LogConfig LoggerFactory::config_ = {};
bool LoggerFactory::configured_ = false;

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

/// Sinks shared by every stage logger of a run
struct SharedSinks {
    spdlog::sink_ptr console;
    spdlog::sink_ptr file;
};

SharedSinks& sharedSinks() {
    static SharedSinks sinks;
    return sinks;
}

std::vector<spdlog::sink_ptr> activeSinks(const LogConfig& config) {
    auto& shared = sharedSinks();
    if (!shared.console) {
        shared.console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    shared.console->set_level(toSpdlog(config.level));

    std::vector<spdlog::sink_ptr> sinks{shared.console};
    if (shared.file) {
        shared.file->set_level(toSpdlog(config.level));
        sinks.push_back(shared.file);
    }
    return sinks;
}

}  // anonymous namespace

std::optional<LogLevel> logLevelFromString(const std::string& str) {
    if (str == "trace") return LogLevel::Trace;
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warning" || str == "warn") return LogLevel::Warning;
    if (str == "error") return LogLevel::Error;
    if (str == "critical") return LogLevel::Critical;
    if (str == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto sinks = activeSinks(config_);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(toSpdlog(config_.level));
    logger->set_pattern(config_.pattern);

    spdlog::register_logger(logger);
    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    config_ = config;
    configured_ = true;

    auto& shared = sharedSinks();
    shared.file.reset();
    if (config.enableFileLogging && !config.logDirectory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.logDirectory, ec);
        if (!ec) {
            auto logFile = config.logDirectory / "sweep_recon.log";
            shared.file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), config.maxFileSize, config.maxFiles);
        }
    }

    spdlog::set_level(toSpdlog(config.level));
    spdlog::set_pattern(config.pattern);

    // Loggers created before configuration pick up the new sinks
    auto sinks = activeSinks(config_);
    spdlog::apply_all([&sinks, &config](std::shared_ptr<spdlog::logger> logger) {
        logger->sinks() = sinks;
        logger->set_level(toSpdlog(config.level));
        logger->set_pattern(config.pattern);
    });

    if (config.enableFileLogging && !shared.file) {
        spdlog::warn("Cannot create log directory {}, logging to console only",
                     config.logDirectory.string());
    }
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    config_.level = level;
    spdlog::set_level(toSpdlog(level));

    activeSinks(config_);
    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(toSpdlog(level));
    });
}

LogLevel LoggerFactory::getGlobalLevel() {
    return config_.level;
}

bool LoggerFactory::isConfigured() {
    return configured_;
}

void LoggerFactory::shutdown() {
    spdlog::shutdown();
    sharedSinks() = SharedSinks{};
    configured_ = false;
}

}  // namespace sweep_recon::logging
