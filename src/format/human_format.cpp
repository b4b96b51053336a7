#include "pintui/format/human_format.hpp"
#include "pintui/common/constants.hpp"
#include "pintui/term/terminal.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>

namespace pintui {
namespace format {

namespace {

using namespace constants::units;

struct SizeUnit {
    const char* suffix;
    uint64_t multiplier;
};

// Longest suffixes first so "KB" is never read as a number ending in "K".
constexpr SizeUnit SIZE_UNITS[] = {
    {"TB", TB},
    {"GB", GB},
    {"MB", MB},
    {"KB", KB},
    {"B", 1},
};

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.length();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.length() >= suffix.length() &&
           text.compare(text.length() - suffix.length(), suffix.length(), suffix) == 0;
}

ParseSizeResult failure(FormatErrorCode code, const std::string& input, const std::string& detail) {
    ParseSizeResult result;
    result.error_code = code;
    result.error_message = FormatErrorCodeHelper::getMessage(code);
    if (!detail.empty()) {
        result.error_message += ": '" + detail + "'";
    }
    result.error_context.component = "format";
    result.error_context.with("code", FormatErrorCodeHelper::toString(code)).with("input", input);
    return result;
}

bool parseDecimal(const std::string& text, double& value) {
    if (text.empty() || text[0] == '+') {
        return false;
    }
    
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    iss >> value;
    
    return !iss.fail() && iss.eof();
}

}

std::string humanSize(uint64_t bytes) {
    double value = static_cast<double>(bytes);
    
    if (bytes >= TB) {
        return fmt::format("{:.2f} TB", value / static_cast<double>(TB));
    } else if (bytes >= GB) {
        return fmt::format("{:.1f} GB", value / static_cast<double>(GB));
    } else if (bytes >= MB) {
        return fmt::format("{:.1f} MB", value / static_cast<double>(MB));
    } else if (bytes >= KB) {
        return fmt::format("{:.1f} KB", value / static_cast<double>(KB));
    }
    return fmt::format("{} B", bytes);
}

ParseSizeResult parseSize(const std::string& text) {
    std::string normalized = toUpper(trim(text));
    
    if (normalized.empty()) {
        return failure(FormatErrorCode::SIZE_EMPTY, text, "");
    }
    
    std::string number_part = normalized;
    uint64_t multiplier = 1;
    bool has_suffix = false;
    
    for (const auto& unit : SIZE_UNITS) {
        if (endsWith(normalized, unit.suffix)) {
            number_part = normalized.substr(0, normalized.length() - std::char_traits<char>::length(unit.suffix));
            multiplier = unit.multiplier;
            has_suffix = true;
            break;
        }
    }
    
    number_part = trim(number_part);
    
    if (number_part.empty() && has_suffix) {
        return failure(FormatErrorCode::SIZE_MISSING_NUMBER, text, normalized);
    }
    
    double value = 0.0;
    if (!parseDecimal(number_part, value) || !std::isfinite(value)) {
        return failure(FormatErrorCode::SIZE_INVALID_NUMBER, text, number_part);
    }
    
    if (value < 0.0) {
        return failure(FormatErrorCode::SIZE_NEGATIVE, text, number_part);
    }
    
    double product = value * static_cast<double>(multiplier);
    if (product >= 18446744073709551616.0) {
        return failure(FormatErrorCode::SIZE_OVERFLOW, text, number_part);
    }
    
    ParseSizeResult result;
    result.bytes = static_cast<uint64_t>(product);
    return result;
}

std::string humanDuration(std::chrono::nanoseconds duration) {
    using namespace std::chrono;
    
    if (duration.count() < 0) {
        return "0ms";
    }
    
    auto total_millis = duration_cast<milliseconds>(duration).count();
    auto secs = duration_cast<seconds>(duration).count();
    auto millis = total_millis % 1000;
    
    if (secs == 0) {
        return fmt::format("{}ms", total_millis);
    } else if (secs < 60) {
        return fmt::format("{}.{}s", secs, millis / 100);
    } else if (secs < 3600) {
        return fmt::format("{}m {}s", secs / 60, secs % 60);
    }
    return fmt::format("{}h {}m", secs / 3600, (secs % 3600) / 60);
}

std::string humanCount(uint64_t count) {
    std::string digits = std::to_string(count);
    if (digits.length() <= 3) {
        return digits;
    }
    
    std::string result;
    result.reserve(digits.length() + digits.length() / 3);
    for (size_t i = 0; i < digits.length(); ++i) {
        if (i > 0 && (digits.length() - i) % 3 == 0) {
            result.push_back(',');
        }
        result.push_back(digits[i]);
    }
    return result;
}

std::string pluralize(long long count, const std::string& singular, const std::string& plural) {
    return fmt::format("{} {}", count, count == 1 ? singular : plural);
}

std::string truncatePath(const std::string& path, size_t max_width) {
    auto chars = term::splitDisplayChars(path);
    
    size_t total_width = 0;
    for (const auto& ch : chars) {
        total_width += static_cast<size_t>(ch.width);
    }
    
    if (total_width <= max_width) {
        return path;
    }
    if (max_width <= 3) {
        return "...";
    }
    
    size_t budget = max_width - 3;
    size_t used = 0;
    size_t start = path.length();
    
    for (auto it = chars.rbegin(); it != chars.rend(); ++it) {
        size_t width = static_cast<size_t>(it->width);
        if (used + width > budget) {
            break;
        }
        used += width;
        start = it->offset;
    }
    
    // A combining mark whose base character was cut off would attach to the dots.
    auto first = std::find_if(chars.begin(), chars.end(),
                              [start](const term::DisplayChar& ch) { return ch.offset == start; });
    while (first != chars.end() && first->width == 0) {
        start = first->offset + first->length;
        ++first;
    }
    
    return "..." + path.substr(start);
}

}
}
