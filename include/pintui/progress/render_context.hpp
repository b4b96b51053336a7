#pragma once

#include "../common/config.hpp"
#include "../term/color_state.hpp"
#include <chrono>
#include <ostream>

namespace pintui {
namespace progress {

struct ProgressOptions {
    std::chrono::milliseconds tick_interval{80};
    int bar_width = 40;
    // Without animation no frames or partial bars are drawn; only the
    // final status lines reach the stream.
    bool animate = true;
    // 0 disables truncation of spinner messages.
    int line_width = 0;
    
    static ProgressOptions fromConfig(const common::ProgressConfig& config);
};

// Where and how a progress indicator renders. The streams and color state
// must outlive every indicator created with the context.
struct RenderContext {
    std::ostream* out;
    std::ostream* err;
    const term::ColorState* colors;
    ProgressOptions options;
    
    static RenderContext standard();
    static RenderContext forStreams(std::ostream& out, std::ostream& err,
                                    const term::ColorState& colors,
                                    ProgressOptions options = ProgressOptions());
};

}}
