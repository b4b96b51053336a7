#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace pintui {
namespace common {

// Process-wide logger. Every call is a no-op until initialize() runs, so
// rendering code can log freely without producing output in host programs
// that never configure logging.
//
// Messages follow "[Component] Event | key=value". Ticker threads log while
// the main thread may initialize or shut down, so the logger pointer is
// only read and replaced through the atomic shared_ptr functions.
class Logger {
public:
    static Logger& instance();
    
    // Writes to the rotating file named by logging_config.file, or to
    // stderr when no file is configured or it cannot be opened.
    void initialize(const LoggingConfig& logging_config);
    void setLevel(LogLevel level);
    void flush();
    void shutdown();
    
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        log(spdlog::level::err, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        log(spdlog::level::warn, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        log(spdlog::level::info, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        log(spdlog::level::debug, format, std::forward<Args>(args)...);
    }
    
    bool isInitialized() const { return std::atomic_load(&logger_) != nullptr; }
    bool writesToFile() const { return writes_to_file_; }

private:
    Logger() = default;
    
    template<typename... Args>
    void log(spdlog::level::level_enum level, const std::string& format, Args&&... args) {
        auto logger = std::atomic_load(&logger_);
        if (logger && logger->should_log(level)) {
            logger->log(level, fmt::runtime(format), std::forward<Args>(args)...);
        }
    }
    
    spdlog::sink_ptr createFileSink(const LoggingConfig& logging_config);
    
    // Serializes initialize() and shutdown() against each other.
    std::mutex lifecycle_mutex_;
    
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<bool> writes_to_file_{false};
};

spdlog::level::level_enum toSpdlogLevel(LogLevel level);

// JSON logs get ".json" inserted before the extension: app.log -> app.json.log
std::string logFileForFormat(const std::string& base_path, LogFormat format);

}}
