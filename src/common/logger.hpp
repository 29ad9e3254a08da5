#pragma once

// Windows headers define ERROR
#ifdef ERROR
#undef ERROR
#endif

#include <spdlog/spdlog.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace riglink {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF,
};

// Unknown names map to INFO
LogLevel log_level_from_string(std::string_view name);
std::string_view log_level_name(LogLevel level);

struct LogConfig {
    LogLevel global_level = LogLevel::INFO;
    bool console_color = true;

    // Rotating file sink, disabled when file_path is empty
    std::string file_path;
    size_t file_max_bytes = 10 * 1024 * 1024;
    size_t file_count = 5;

    // "client" applies to "client.auth" unless that has its own entry
    std::unordered_map<std::string, LogLevel> module_levels;

    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
};

// Named spdlog logger, one per module ("client.orchestrator", "client.auth", ...)
class Logger {
public:
    static Logger& get(const std::string& module);

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        impl_->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        impl_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        impl_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        impl_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        impl_->error(fmt, std::forward<Args>(args)...);
    }

    const std::string& module() const { return impl_->name(); }
    bool enabled(LogLevel level) const;

private:
    friend class LogManager;
    explicit Logger(std::shared_ptr<spdlog::logger> impl) : impl_(std::move(impl)) {}

    std::shared_ptr<spdlog::logger> impl_;
};

// ============================================================================
// Log Manager
// ============================================================================
//
// Owns the sinks shared by every module logger. Loggers handed out before
// configure() keep working; they pick up the new sinks and levels.
// Until configured, RIGLINK_LOG_LEVEL and RIGLINK_LOG_FILE are honoured.

class LogManager {
public:
    static LogManager& instance();

    void configure(const LogConfig& config);
    void configure_from_env();

    void set_module_level(const std::string& module, LogLevel level);

    // Effective level for a module after parent lookup
    LogLevel level_for(const std::string& module) const;

    Logger& logger(const std::string& module);

    void flush();

private:
    LogManager();
    ~LogManager();

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    void rebuild_sinks();
    void apply_levels();
    LogLevel resolve(const std::string& module) const;

    mutable std::shared_mutex mutex_;
    LogConfig config_;
    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;
};

} // namespace riglink
