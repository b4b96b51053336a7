#pragma once

#include <atomic>
#include <functional>
#include <string>

namespace pintui {
namespace term {

// Single source of truth for whether ANSI styling is emitted. Renderers
// read enabled() at the moment they write, so setColor() takes effect on
// the next frame of an already running spinner.
class ColorState {
public:
    using EnvLookup = std::function<const char*(const char*)>;
    
    ColorState();
    explicit ColorState(bool enabled);
    
    ColorState(const ColorState&) = delete;
    ColorState& operator=(const ColorState&) = delete;
    
    // Process-wide instance, initialized from the environment on first use.
    static ColorState& global();
    
    void init();
    void init(const EnvLookup& env, bool is_terminal);
    
    // NO_COLOR > CLICOLOR_FORCE > CLICOLOR > terminal detection.
    static bool detect(const EnvLookup& env, bool is_terminal);
    
    void setColor(bool enabled);
    bool enabled() const { return enabled_.load(std::memory_order_acquire); }
    
    std::string paint(const std::string& text, const char* style) const;

private:
    std::atomic<bool> enabled_;
};

}}
