#include "pintui/common/logger.hpp"
#include "pintui/common/constants.hpp"
#include "pintui/term/terminal.hpp"
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <unistd.h>

namespace pintui {
namespace common {

namespace {

constexpr const char* LOGGER_NAME = "pintui";
constexpr const char* TEXT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr const char* JSON_PATTERN = R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})";

// A spinner may own the current terminal line. On a terminal each record
// first erases that line so the log text does not run into a frame; the
// spinner redraws below it on its next tick.
class TerminalStderrSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    TerminalStderrSink() : erase_first_(term::isTerminal(STDERR_FILENO)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);
        
        if (erase_first_) {
            std::fputs(constants::ansi::ERASE_LINE, stderr);
        }
        std::fwrite(formatted.data(), 1, formatted.size(), stderr);
    }
    
    void flush_() override {
        std::fflush(stderr);
    }

private:
    bool erase_first_;
};

}

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::warn;
}

std::string logFileForFormat(const std::string& base_path, LogFormat format) {
    if (format != LogFormat::JSON) {
        return base_path;
    }
    
    std::filesystem::path path(base_path);
    std::string name = path.stem().string() + ".json" + path.extension().string();
    return (path.parent_path() / name).string();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

spdlog::sink_ptr Logger::createFileSink(const LoggingConfig& logging_config) {
    std::filesystem::path log_dir = std::filesystem::path(logging_config.file).parent_path();
    
    std::error_code ec;
    if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
        std::filesystem::create_directories(log_dir, ec);
    }
    if (ec) {
        std::cerr << "[Logger] Failed to create log directory: " << log_dir
                  << " - " << ec.message() << ", logging to stderr" << std::endl;
        return nullptr;
    }
    
    try {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFileForFormat(logging_config.file, logging_config.format),
            logging_config.rotation_size_mb * constants::units::MB,
            logging_config.max_files);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Failed to open log file: " << logging_config.file
                  << " - " << ex.what() << ", logging to stderr" << std::endl;
        return nullptr;
    }
}

void Logger::initialize(const LoggingConfig& logging_config) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    
    if (auto existing = std::atomic_load(&logger_)) {
        existing->warn("[Logger] Already initialized, ignoring duplicate initialization");
        return;
    }
    
    spdlog::sink_ptr sink;
    if (!logging_config.file.empty()) {
        sink = createFileSink(logging_config);
    }
    bool to_file = sink != nullptr;
    if (!sink) {
        sink = std::make_shared<TerminalStderrSink>();
    }
    
    spdlog::drop(LOGGER_NAME);
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    
    // JSON only makes sense in files; stderr stays readable.
    bool json = to_file && logging_config.format == LogFormat::JSON;
    logger->set_pattern(json ? JSON_PATTERN : TEXT_PATTERN);
    logger->set_level(toSpdlogLevel(logging_config.level));
    
    if (to_file) {
        logger->flush_on(spdlog::level::info);
    }
    
    spdlog::register_logger(logger);
    writes_to_file_ = to_file;
    std::atomic_store(&logger_, logger);
    
    logger->debug("[Logger] Initialized | level={} | file={}",
                  to_string(logging_config.level), to_file ? logging_config.file : "-");
}

void Logger::setLevel(LogLevel level) {
    if (auto logger = std::atomic_load(&logger_)) {
        logger->set_level(toSpdlogLevel(level));
    }
}

void Logger::flush() {
    if (auto logger = std::atomic_load(&logger_)) {
        logger->flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    
    // Threads still holding the old pointer finish their record on it.
    auto logger = std::atomic_exchange(&logger_, std::shared_ptr<spdlog::logger>());
    if (!logger) {
        return;
    }
    logger->flush();
    spdlog::drop(LOGGER_NAME);
    writes_to_file_ = false;
}

}}
