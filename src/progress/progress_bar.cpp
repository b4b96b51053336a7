#include "pintui/progress/progress_bar.hpp"
#include "pintui/common/constants.hpp"
#include "pintui/common/logger.hpp"
#include "pintui/term/icons.hpp"
#include "pintui/term/terminal.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace pintui {
namespace progress {

namespace {

std::string repeat(const char* glyph, int count) {
    std::string result;
    for (int i = 0; i < count; ++i) {
        result += glyph;
    }
    return result;
}

}

ProgressBar::ProgressBar(uint64_t total, const std::string& description, RenderContext context)
    : total_(total),
      description_(description),
      context_(context) {
    common::Logger::instance().debug("[Bar] Created | description={} | total={} | animate={}",
                                     description_, total_, context_.options.animate);
}

ProgressBar::~ProgressBar() {
    if (!finished_ && drawn_) {
        clear();
    }
}

void ProgressBar::add(uint64_t delta) {
    if (finished_) {
        common::Logger::instance().debug("[Bar] Ignoring add after finish | description={}", description_);
        return;
    }
    uint64_t headroom = std::numeric_limits<uint64_t>::max() - current_;
    current_ += std::min(delta, headroom);
    render();
}

void ProgressBar::set(uint64_t value) {
    if (finished_) {
        common::Logger::instance().debug("[Bar] Ignoring set after finish | description={}", description_);
        return;
    }
    current_ = value;
    render();
}

double ProgressBar::percentage() const {
    if (total_ == 0) {
        return 1.0;
    }
    uint64_t clamped = std::min(current_, total_);
    return static_cast<double>(clamped) / static_cast<double>(total_);
}

std::string ProgressBar::renderBar(int width) const {
    using namespace constants::bar;
    using constants::ansi::BLUE;
    using constants::ansi::CYAN;
    
    const auto& colors = *context_.colors;
    double fraction = percentage();
    int filled = std::min(static_cast<int>(fraction * width), width);
    
    if (filled >= width) {
        return colors.paint(repeat(FILLED, width), CYAN);
    }
    
    std::string bar_text;
    int padding = width - filled;
    
    if (fraction > 0.0) {
        bar_text += colors.paint(repeat(FILLED, filled) + HEAD, CYAN);
        padding -= 1;
    }
    bar_text += colors.paint(repeat(PADDING, padding), BLUE);
    return bar_text;
}

std::string ProgressBar::renderLine() const {
    std::string count = std::to_string(std::min(current_, total_)) + "/" + std::to_string(total_);
    std::string description = description_;
    int bar_width = std::max(context_.options.bar_width, 1);
    
    if (context_.options.line_width > 0) {
        // One spare column so the cursor never wraps onto the next line.
        int usable = context_.options.line_width - 1;
        int count_width = term::displayWidth(count);
        
        // Brackets and the space before the count take three columns.
        bar_width = std::max(1, std::min(bar_width, usable - count_width - 3));
        int remaining = usable - (bar_width + 3 + count_width) - 1;
        description = remaining > 3 ? term::truncateToWidth(description_, remaining) : "";
    }
    
    std::ostringstream line;
    if (!description.empty()) {
        line << description << " ";
    }
    line << constants::bar::START << renderBar(bar_width) << constants::bar::END << " " << count;
    
    return line.str();
}

void ProgressBar::render() {
    if (!context_.options.animate) {
        return;
    }
    
    *context_.out << constants::ansi::CARRIAGE_RETURN << renderLine()
                  << constants::ansi::ERASE_TO_EOL << std::flush;
    drawn_ = true;
}

bool ProgressBar::beginFinish(const char* outcome) {
    if (finished_) {
        common::Logger::instance().debug("[Bar] Ignoring repeated finish | outcome={}", outcome);
        return false;
    }
    finished_ = true;
    
    if (drawn_) {
        *context_.out << constants::ansi::ERASE_LINE << std::flush;
    }
    
    common::Logger::instance().debug("[Bar] Finished | outcome={} | current={} | total={}",
                                     outcome, current_, total_);
    return true;
}

void ProgressBar::success(const std::string& message) {
    if (!beginFinish("success")) return;
    *context_.out << term::icons::ok(*context_.colors) << " " << message << "\n" << std::flush;
}

void ProgressBar::error(const std::string& message) {
    if (!beginFinish("error")) return;
    *context_.err << term::icons::fail(*context_.colors) << " " << message << "\n" << std::flush;
}

void ProgressBar::clear() {
    beginFinish("clear");
}

std::unique_ptr<ProgressBar> bar(uint64_t total, const std::string& description, RenderContext context) {
    return std::make_unique<ProgressBar>(total, description, context);
}

}}
