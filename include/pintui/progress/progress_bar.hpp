#pragma once

#include "render_context.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace pintui {
namespace progress {

// Determinate progress, redrawn synchronously by add() and set(). The
// stored position may run past total; the rendering clamps it.
// After success(), error() or clear() the bar ignores further updates.
class ProgressBar {
public:
    ProgressBar(uint64_t total, const std::string& description,
                RenderContext context = RenderContext::standard());
    ~ProgressBar();
    
    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;
    
    void add(uint64_t delta);
    void set(uint64_t value);
    
    void success(const std::string& message);
    void error(const std::string& message);
    void clear();
    
    uint64_t current() const { return current_; }
    uint64_t total() const { return total_; }
    const std::string& description() const { return description_; }
    bool isFinished() const { return finished_; }
    
    // Fraction in [0, 1]; an empty bar (total 0) counts as complete.
    double percentage() const;
    
    // Fits within the line width limit by narrowing the bar, then
    // truncating or dropping the description.
    std::string renderLine() const;

private:
    void render();
    bool beginFinish(const char* outcome);
    std::string renderBar(int width) const;
    
    uint64_t total_;
    uint64_t current_ = 0;
    std::string description_;
    RenderContext context_;
    bool finished_ = false;
    bool drawn_ = false;
};

std::unique_ptr<ProgressBar> bar(uint64_t total, const std::string& description,
                                 RenderContext context = RenderContext::standard());

}}
