#pragma once

#include "../common/error_framework.hpp"

namespace pintui {
namespace format {

// Every code below is an InvalidFormat condition: the caller supplied text
// that is not a size string. No other failure exists in the formatter.
enum class FormatErrorCode {
    SIZE_EMPTY = 100,
    SIZE_MISSING_NUMBER = 101,
    SIZE_INVALID_NUMBER = 102,
    SIZE_NEGATIVE = 103,
    SIZE_OVERFLOW = 104
};

inline bool isInvalidFormat(FormatErrorCode code) {
    int value = static_cast<int>(code);
    return value >= 100 && value < 200;
}

using FormatErrorCodeHelper = common::ErrorRegistry<FormatErrorCode>;

}

namespace common {

template<>
struct ErrorTable<format::FormatErrorCode> {
    using Code = format::FormatErrorCode;
    
    static constexpr ErrorInfo<Code> entries[] = {
        {Code::SIZE_EMPTY, "SIZE_EMPTY", "Empty size string"},
        {Code::SIZE_MISSING_NUMBER, "SIZE_MISSING_NUMBER", "Size unit has no numeric value"},
        {Code::SIZE_INVALID_NUMBER, "SIZE_INVALID_NUMBER", "Invalid number in size"},
        {Code::SIZE_NEGATIVE, "SIZE_NEGATIVE", "Size cannot be negative"},
        {Code::SIZE_OVERFLOW, "SIZE_OVERFLOW", "Size exceeds the 64-bit byte range"},
    };
};

}}
