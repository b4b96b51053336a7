#pragma once

#include "error_codes.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace pintui {
namespace format {

struct ParseSizeResult {
    std::optional<uint64_t> bytes;
    std::optional<FormatErrorCode> error_code;
    std::string error_message;
    common::ErrorContext error_context;
    
    bool ok() const { return bytes.has_value(); }
    explicit operator bool() const { return ok(); }
};

// 1024-based units. Sub-KB values have no decimals, TB has two.
//   humanSize(1023) == "1023 B", humanSize(1024) == "1.0 KB"
std::string humanSize(uint64_t bytes);

// Inverse of humanSize: "<number>[B|KB|MB|GB|TB]", case-insensitive,
// surrounding whitespace ignored. The product is truncated to whole bytes.
ParseSizeResult parseSize(const std::string& text);

std::string humanDuration(std::chrono::nanoseconds duration);

std::string humanCount(uint64_t count);

std::string pluralize(long long count, const std::string& singular, const std::string& plural);

// Keeps the end of the path, which usually holds the file name. Width is
// measured in terminal columns, so multi-byte characters are never split.
std::string truncatePath(const std::string& path, size_t max_width);

}
}
