#pragma once

#include "animation_ticker.hpp"
#include "render_context.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace pintui {
namespace progress {

enum class IndicatorState {
    CREATED,
    RUNNING,
    FINISHED
};

// Indeterminate progress: a glyph cycling on a fixed cadence in front of
// a message, redrawn in place on one terminal line.
//
// Exactly one of success(), error(), warn() or clear() finishes the
// spinner; later finishing calls are no-ops. A spinner destroyed while
// running is cleared.
class Spinner {
public:
    explicit Spinner(const std::string& message,
                     RenderContext context = RenderContext::standard(),
                     const std::string& prefix = "");
    ~Spinner();
    
    Spinner(const Spinner&) = delete;
    Spinner& operator=(const Spinner&) = delete;
    
    void start();
    void updateMessage(const std::string& message);
    
    void success(const std::string& message);
    void error(const std::string& message);
    void warn(const std::string& message);
    void clear();
    
    IndicatorState state() const { return state_.load(); }
    bool isRunning() const { return state() == IndicatorState::RUNNING; }
    bool isFinished() const { return state() == IndicatorState::FINISHED; }
    bool isTicking() const;
    
    std::string message() const;
    const std::string& prefix() const { return prefix_; }
    size_t frameIndex() const { return frame_index_.load(); }
    size_t redrawCount() const { return redraws_.load(); }

private:
    void drawFrame(size_t tick);
    std::string composeLine(size_t frame) const;
    bool beginFinish(const char* outcome);
    void writeFinalLine(std::ostream& stream, const std::string& icon, const std::string& message);
    
    std::string message_;
    const std::string prefix_;
    RenderContext context_;
    std::unique_ptr<AnimationTicker> ticker_;
    
    mutable std::mutex mutex_;
    std::atomic<IndicatorState> state_{IndicatorState::CREATED};
    std::atomic<size_t> frame_index_{0};
    std::atomic<size_t> redraws_{0};
};

std::unique_ptr<Spinner> spinner(const std::string& message,
                                 RenderContext context = RenderContext::standard());

}}
