#pragma once

#include <map>
#include <string>

namespace pintui {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* name;
    const char* message;
};

// Specialize for each error enum with a static constexpr `entries` array.
template<typename EnumType>
struct ErrorTable;

template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>* find(EnumType code) {
        for (const auto& info : ErrorTable<EnumType>::entries) {
            if (info.code == code) {
                return &info;
            }
        }
        return nullptr;
    }
    
    static const char* toString(EnumType code) {
        const auto* info = find(code);
        return info ? info->name : "UNKNOWN";
    }
    
    static const char* getMessage(EnumType code) {
        const auto* info = find(code);
        return info ? info->message : "Unknown error";
    }
    
    static int value(EnumType code) {
        return static_cast<int>(code);
    }
};

// Where a failure happened and the inputs that caused it, kept apart from
// the human-readable message so callers can log the pieces as fields.
struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
    
    ErrorContext& with(const std::string& key, const std::string& value) {
        details[key] = value;
        return *this;
    }
};

// "key=value | key=value", keys in sorted order.
inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    return result;
}

}}
