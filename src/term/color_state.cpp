#include "pintui/term/color_state.hpp"
#include "pintui/term/terminal.hpp"
#include "pintui/common/constants.hpp"
#include "pintui/common/logger.hpp"
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <unistd.h>

namespace pintui {
namespace term {

namespace {

const char* systemEnv(const char* name) {
    return std::getenv(name);
}

bool isSet(const char* value) {
    return value != nullptr && *value != '\0';
}

}

ColorState::ColorState() : enabled_(false) {}

ColorState::ColorState(bool enabled) : enabled_(enabled) {}

ColorState& ColorState::global() {
    static ColorState instance;
    static std::once_flag once;
    std::call_once(once, [] { instance.init(); });
    return instance;
}

void ColorState::init() {
    init(systemEnv, isTerminal(STDOUT_FILENO));
}

void ColorState::init(const EnvLookup& env, bool is_terminal) {
    bool enabled = detect(env, is_terminal);
    setColor(enabled);
    common::Logger::instance().debug("[Color] Detected | enabled={} | is_terminal={}", enabled, is_terminal);
}

bool ColorState::detect(const EnvLookup& env, bool is_terminal) {
    if (isSet(env("NO_COLOR"))) {
        return false;
    }
    
    const char* force = env("CLICOLOR_FORCE");
    if (isSet(force) && std::strcmp(force, "0") != 0) {
        return true;
    }
    
    const char* clicolor = env("CLICOLOR");
    if (clicolor != nullptr) {
        return std::strcmp(clicolor, "0") != 0;
    }
    
    return is_terminal;
}

void ColorState::setColor(bool enabled) {
    enabled_.store(enabled, std::memory_order_release);
}

std::string ColorState::paint(const std::string& text, const char* style) const {
    if (!enabled() || style == nullptr || *style == '\0') {
        return text;
    }
    return std::string(style) + text + constants::ansi::RESET;
}

}}
