#include "pintui/progress/spinner.hpp"
#include "pintui/common/constants.hpp"
#include "pintui/common/logger.hpp"
#include "pintui/term/icons.hpp"
#include "pintui/term/terminal.hpp"

namespace pintui {
namespace progress {

using constants::spinner::FRAMES;

Spinner::Spinner(const std::string& message, RenderContext context, const std::string& prefix)
    : message_(message),
      prefix_(prefix),
      context_(context) {}

Spinner::~Spinner() {
    if (isRunning()) {
        clear();
    }
}

void Spinner::start() {
    IndicatorState expected = IndicatorState::CREATED;
    if (!state_.compare_exchange_strong(expected, IndicatorState::RUNNING)) {
        return;
    }
    
    common::Logger::instance().debug("[Spinner] Started | message={} | animate={} | interval_ms={}",
                                     message(), context_.options.animate,
                                     context_.options.tick_interval.count());
    
    if (!context_.options.animate) {
        return;
    }
    
    ticker_ = std::make_unique<AnimationTicker>(context_.options.tick_interval,
                                                [this](size_t tick) { drawFrame(tick); });
    ticker_->start();
}

void Spinner::updateMessage(const std::string& message) {
    if (isFinished()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    message_ = message;
}

std::string Spinner::message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return message_;
}

bool Spinner::isTicking() const {
    return ticker_ && ticker_->isRunning();
}

std::string Spinner::composeLine(size_t frame) const {
    std::string text = message_;
    
    if (context_.options.line_width > 0) {
        // Glyph, space, prefix, and one spare column so the line never wraps.
        int available = context_.options.line_width - 3 - term::displayWidth(prefix_);
        text = term::truncateToWidth(text, available);
    }
    
    std::string line = constants::ansi::CARRIAGE_RETURN;
    line += context_.colors->paint(FRAMES[frame], constants::ansi::CYAN);
    line += " ";
    line += prefix_;
    line += text;
    line += constants::ansi::ERASE_TO_EOL;
    return line;
}

void Spinner::drawFrame(size_t tick) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != IndicatorState::RUNNING) {
        return;
    }
    
    size_t frame = tick % FRAMES.size();
    frame_index_ = frame;
    *context_.out << composeLine(frame) << std::flush;
    redraws_.fetch_add(1);
}

bool Spinner::beginFinish(const char* outcome) {
    IndicatorState previous = state_.exchange(IndicatorState::FINISHED);
    if (previous == IndicatorState::FINISHED) {
        common::Logger::instance().debug("[Spinner] Ignoring repeated finish | outcome={}", outcome);
        return false;
    }
    
    // The ticker thread must be gone before anything else touches the line.
    if (ticker_) {
        ticker_->stop();
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (previous == IndicatorState::RUNNING && context_.options.animate) {
        *context_.out << constants::ansi::ERASE_LINE << std::flush;
    }
    
    common::Logger::instance().debug("[Spinner] Finished | outcome={} | redraws={}", outcome, redraws_.load());
    return true;
}

void Spinner::writeFinalLine(std::ostream& stream, const std::string& icon, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_ = message;
    stream << icon << " " << message << "\n" << std::flush;
}

void Spinner::success(const std::string& message) {
    if (!beginFinish("success")) return;
    writeFinalLine(*context_.out, term::icons::ok(*context_.colors), message);
}

void Spinner::error(const std::string& message) {
    if (!beginFinish("error")) return;
    writeFinalLine(*context_.err, term::icons::fail(*context_.colors), message);
}

void Spinner::warn(const std::string& message) {
    if (!beginFinish("warn")) return;
    writeFinalLine(*context_.out, term::icons::warn(*context_.colors), message);
}

void Spinner::clear() {
    beginFinish("clear");
}

std::unique_ptr<Spinner> spinner(const std::string& message, RenderContext context) {
    auto handle = std::make_unique<Spinner>(message, context);
    handle->start();
    return handle;
}

}}
