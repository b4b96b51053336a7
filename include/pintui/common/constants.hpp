#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pintui {
namespace constants {

namespace system {
    constexpr const char* APPLICATION_NAME = "pintui";
    constexpr const char* CONFIG_ENV_VAR = "PINTUI_CONFIG";
    constexpr const char* CONFIG_DIR_NAME = "pintui";
    constexpr const char* CONFIG_FILE_NAME = "config.toml";
}

namespace version {
    constexpr const char* LIBRARY_VERSION = "0.3.0";
    
    inline std::string getFullVersion() {
        return std::string(system::APPLICATION_NAME) + " v" + LIBRARY_VERSION;
    }
}

namespace units {
    constexpr uint64_t KB = 1024ULL;
    constexpr uint64_t MB = KB * 1024ULL;
    constexpr uint64_t GB = MB * 1024ULL;
    constexpr uint64_t TB = GB * 1024ULL;
}

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* CYAN = "\033[36m";
    
    constexpr const char* CARRIAGE_RETURN = "\r";
    constexpr const char* ERASE_TO_EOL = "\033[K";
    constexpr const char* ERASE_LINE = "\r\033[K";
}

namespace spinner {
    constexpr std::array<const char*, 10> FRAMES = {
        "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"
    };
}

namespace bar {
    constexpr const char* FILLED = "━";
    constexpr const char* HEAD = "╸";
    constexpr const char* PADDING = "─";
    constexpr const char* START = "[";
    constexpr const char* END = "]";
}

namespace terminal {
    constexpr int DEFAULT_WIDTH = 80;
    constexpr int DEFAULT_HEIGHT = 24;
}

namespace limits {
    constexpr int DEFAULT_TICK_INTERVAL_MS = 80;
    constexpr int MIN_TICK_INTERVAL_MS = 10;
    constexpr int MAX_TICK_INTERVAL_MS = 10000;
    constexpr int DEFAULT_BAR_WIDTH = 40;
    constexpr int MIN_BAR_WIDTH = 1;
    constexpr int MAX_BAR_WIDTH = 500;
    
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

}
}
