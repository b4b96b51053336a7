#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace pintui {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

enum class TriState {
    AUTO,
    ALWAYS,
    NEVER
};

struct OutputConfig {
    TriState color;
};

struct ProgressConfig {
    int tick_interval_ms;
    int bar_width;
    TriState animate;
};

struct LoggingConfig {
    LogLevel level;
    std::string file;
    LogFormat format;
    size_t rotation_size_mb;
    size_t max_files;
};

struct GlobalConfig {
    OutputConfig output;
    ProgressConfig progress;
    LoggingConfig logging;
};

std::optional<TriState> parseTriState(const std::string& value);
std::optional<LogLevel> parseLogLevel(const std::string& value);
std::string to_string(TriState value);
std::string to_string(LogLevel level);

class Config {
public:
    static Config& instance();
    
    static GlobalConfig createDefaultConfig();
    
    // Loads the first readable file from the search path. A missing file
    // keeps the defaults and still counts as success.
    bool load(const std::string& config_file = "");
    void reset();
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    std::vector<std::string> getConfigSearchPaths(const std::string& explicit_path = "") const;
    std::optional<std::string> findBestConfig(const std::string& explicit_path = "") const;
    const std::string& currentConfigPath() const { return current_config_path_; }

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

}}
