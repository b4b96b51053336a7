#include "pintui/progress/render_context.hpp"
#include "pintui/term/terminal.hpp"
#include <iostream>
#include <unistd.h>

namespace pintui {
namespace progress {

ProgressOptions ProgressOptions::fromConfig(const common::ProgressConfig& config) {
    ProgressOptions options;
    options.tick_interval = std::chrono::milliseconds(config.tick_interval_ms);
    options.bar_width = config.bar_width;
    
    bool stdout_is_terminal = term::isTerminal(STDOUT_FILENO);
    switch (config.animate) {
        case common::TriState::ALWAYS:
            options.animate = true;
            break;
        case common::TriState::NEVER:
            options.animate = false;
            break;
        case common::TriState::AUTO:
            options.animate = stdout_is_terminal;
            break;
    }
    
    options.line_width = stdout_is_terminal ? term::terminalWidth() : 0;
    return options;
}

RenderContext RenderContext::standard() {
    return forStreams(std::cout, std::cerr, term::ColorState::global(),
                      ProgressOptions::fromConfig(common::Config::instance().global().progress));
}

RenderContext RenderContext::forStreams(std::ostream& out, std::ostream& err,
                                        const term::ColorState& colors,
                                        ProgressOptions options) {
    RenderContext context;
    context.out = &out;
    context.err = &err;
    context.colors = &colors;
    context.options = options;
    return context;
}

}}
