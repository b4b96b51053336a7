#include "pintui/common/config.hpp"
#include "pintui/common/constants.hpp"
#include "pintui/common/logger.hpp"
#include <toml.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace pintui {
namespace common {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool inRange(int value, int min_value, int max_value) {
    return value >= min_value && value <= max_value;
}

}

std::optional<TriState> parseTriState(const std::string& value) {
    std::string lowered = toLower(value);
    if (lowered == "auto") return TriState::AUTO;
    if (lowered == "always" || lowered == "true" || lowered == "on") return TriState::ALWAYS;
    if (lowered == "never" || lowered == "false" || lowered == "off") return TriState::NEVER;
    return std::nullopt;
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    std::string lowered = toLower(value);
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "debug") return LogLevel::DEBUG;
    return std::nullopt;
}

std::string to_string(TriState value) {
    switch (value) {
        case TriState::AUTO: return "auto";
        case TriState::ALWAYS: return "always";
        case TriState::NEVER: return "never";
    }
    return "auto";
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::limits;
    
    GlobalConfig config;
    
    config.output.color = TriState::AUTO;
    
    config.progress.tick_interval_ms = DEFAULT_TICK_INTERVAL_MS;
    config.progress.bar_width = DEFAULT_BAR_WIDTH;
    config.progress.animate = TriState::AUTO;
    
    config.logging.level = LogLevel::WARN;
    config.logging.file = "";
    config.logging.format = LogFormat::TEXT;
    config.logging.rotation_size_mb = DEFAULT_LOG_ROTATION_SIZE_MB;
    config.logging.max_files = DEFAULT_LOG_MAX_FILES;
    
    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::vector<std::string> Config::getConfigSearchPaths(const std::string& explicit_path) const {
    std::vector<std::string> paths;
    
    if (!explicit_path.empty()) {
        paths.push_back(explicit_path);
        return paths;
    }
    
    const char* env_path = std::getenv(constants::system::CONFIG_ENV_VAR);
    if (env_path && *env_path) {
        paths.push_back(env_path);
    }
    
    std::filesystem::path relative = std::filesystem::path(constants::system::CONFIG_DIR_NAME) /
                                     constants::system::CONFIG_FILE_NAME;
    
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        paths.push_back((std::filesystem::path(xdg) / relative).string());
    }
    
    const char* home = std::getenv("HOME");
    if (home && *home) {
        paths.push_back((std::filesystem::path(home) / ".config" / relative).string());
    }
    
    return paths;
}

std::optional<std::string> Config::findBestConfig(const std::string& explicit_path) const {
    for (const auto& path : getConfigSearchPaths(explicit_path)) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    current_config_path_.clear();
    
    auto best = findBestConfig(config_file);
    if (!best) {
        if (!config_file.empty()) {
            Logger::instance().warn("[Config] File not readable | path={}", config_file);
            return false;
        }
        Logger::instance().debug("[Config] No config file found, using defaults");
        return true;
    }
    
    if (!tryLoadTomlFile(*best)) {
        return false;
    }
    
    current_config_path_ = *best;
    return true;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    GlobalConfig parsed = global_;
    
    try {
        auto data = toml::parse(path);
        
        if (data.contains("output")) {
            auto output_section = data.at("output");
            
            if (output_section.contains("color")) {
                std::string color = toml::find<std::string>(output_section, "color");
                if (auto mode = parseTriState(color)) {
                    parsed.output.color = *mode;
                } else {
                    Logger::instance().warn("[Config] Invalid value | key=output.color | value={}", color);
                }
            }
        }
        
        if (data.contains("progress")) {
            auto progress_section = data.at("progress");
            
            if (progress_section.contains("tick_interval_ms")) {
                int interval = toml::find<int>(progress_section, "tick_interval_ms");
                if (inRange(interval, constants::limits::MIN_TICK_INTERVAL_MS,
                            constants::limits::MAX_TICK_INTERVAL_MS)) {
                    parsed.progress.tick_interval_ms = interval;
                } else {
                    Logger::instance().warn("[Config] Out of range | key=progress.tick_interval_ms | value={}",
                                            interval);
                }
            }
            if (progress_section.contains("bar_width")) {
                int width = toml::find<int>(progress_section, "bar_width");
                if (inRange(width, constants::limits::MIN_BAR_WIDTH, constants::limits::MAX_BAR_WIDTH)) {
                    parsed.progress.bar_width = width;
                } else {
                    Logger::instance().warn("[Config] Out of range | key=progress.bar_width | value={}", width);
                }
            }
            if (progress_section.contains("animate")) {
                std::string animate = toml::find<std::string>(progress_section, "animate");
                if (auto mode = parseTriState(animate)) {
                    parsed.progress.animate = *mode;
                } else {
                    Logger::instance().warn("[Config] Invalid value | key=progress.animate | value={}", animate);
                }
            }
        }
        
        if (data.contains("logging")) {
            auto logging_section = data.at("logging");
            
            if (logging_section.contains("level")) {
                std::string level = toml::find<std::string>(logging_section, "level");
                if (auto parsed_level = parseLogLevel(level)) {
                    parsed.logging.level = *parsed_level;
                } else {
                    Logger::instance().warn("[Config] Invalid value | key=logging.level | value={}", level);
                }
            }
            if (logging_section.contains("file")) {
                parsed.logging.file = toml::find<std::string>(logging_section, "file");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                parsed.logging.format = (toLower(format_str) == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
            if (logging_section.contains("rotation_size_mb")) {
                parsed.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                parsed.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
    
    global_ = parsed;
    Logger::instance().info("[Config] Loaded | path={} | color={} | animate={}",
                            path, to_string(global_.output.color), to_string(global_.progress.animate));
    return true;
}

}}
