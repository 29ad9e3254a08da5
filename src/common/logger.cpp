#include "common/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <cctype>
#include <cstdlib>
#include <cstdio>

namespace riglink {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::OFF:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // anonymous namespace

LogLevel log_level_from_string(std::string_view name) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error" || lower == "err" || lower == "critical") return LogLevel::ERROR;
    if (lower == "off" || lower == "none") return LogLevel::OFF;
    return LogLevel::INFO;
}

std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::OFF:   return "off";
    }
    return "info";
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::get(const std::string& module) {
    return LogManager::instance().logger(module);
}

bool Logger::enabled(LogLevel level) const {
    return impl_->should_log(to_spdlog(level));
}

// ============================================================================
// LogManager
// ============================================================================

LogManager& LogManager::instance() {
    static LogManager manager;
    return manager;
}

LogManager::LogManager() {
    if (auto level = std::getenv("RIGLINK_LOG_LEVEL")) {
        config_.global_level = log_level_from_string(level);
    }
    if (auto file = std::getenv("RIGLINK_LOG_FILE")) {
        config_.file_path = file;
    }
    rebuild_sinks();
}

LogManager::~LogManager() {
    for (auto& [_, logger] : loggers_) {
        logger->impl_->flush();
    }
}

void LogManager::configure(const LogConfig& config) {
    std::unique_lock lock(mutex_);
    config_ = config;
    rebuild_sinks();

    for (auto& [_, logger] : loggers_) {
        logger->impl_->sinks() = sinks_;
        logger->impl_->set_pattern(config_.pattern);
    }
    apply_levels();
}

void LogManager::configure_from_env() {
    LogConfig config;
    if (auto level = std::getenv("RIGLINK_LOG_LEVEL")) {
        config.global_level = log_level_from_string(level);
    }
    if (auto file = std::getenv("RIGLINK_LOG_FILE")) {
        config.file_path = file;
    }
    configure(config);
}

void LogManager::set_module_level(const std::string& module, LogLevel level) {
    std::unique_lock lock(mutex_);
    config_.module_levels[module] = level;
    apply_levels();
}

LogLevel LogManager::level_for(const std::string& module) const {
    std::shared_lock lock(mutex_);
    return resolve(module);
}

Logger& LogManager::logger(const std::string& module) {
    {
        std::shared_lock lock(mutex_);
        if (auto it = loggers_.find(module); it != loggers_.end()) {
            return *it->second;
        }
    }

    std::unique_lock lock(mutex_);
    if (auto it = loggers_.find(module); it != loggers_.end()) {
        return *it->second;
    }

    auto impl = std::make_shared<spdlog::logger>(module, sinks_.begin(), sinks_.end());
    impl->set_pattern(config_.pattern);
    impl->set_level(to_spdlog(resolve(module)));

    auto& slot = loggers_[module];
    slot.reset(new Logger(std::move(impl)));
    return *slot;
}

void LogManager::flush() {
    std::shared_lock lock(mutex_);
    for (auto& [_, logger] : loggers_) {
        logger->impl_->flush();
    }
}

void LogManager::rebuild_sinks() {
    sinks_.clear();

    if (config_.console_color) {
        sinks_.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
        sinks_.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }

    if (!config_.file_path.empty()) {
        try {
            sinks_.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config_.file_path, config_.file_max_bytes, config_.file_count));
        } catch (const spdlog::spdlog_ex& ex) {
            // 无法打开日志文件时只输出到控制台
            std::fprintf(stderr, "riglink: cannot open log file %s: %s\n", config_.file_path.c_str(), ex.what());
        }
    }
}

void LogManager::apply_levels() {
    for (auto& [name, logger] : loggers_) {
        logger->impl_->set_level(to_spdlog(resolve(name)));
    }
}

LogLevel LogManager::resolve(const std::string& module) const {
    std::string name = module;
    while (true) {
        if (auto it = config_.module_levels.find(name); it != config_.module_levels.end()) {
            return it->second;
        }
        auto dot = name.rfind('.');
        if (dot == std::string::npos) {
            return config_.global_level;
        }
        name.resize(dot);
    }
}

} // namespace riglink
