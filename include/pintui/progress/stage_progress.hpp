#pragma once

#include "spinner.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace pintui {
namespace progress {

// Numbers a sequence of stages as "[current/total]". Running more stages
// than announced is allowed; the numerator then exceeds the denominator.
class StageProgress {
public:
    explicit StageProgress(size_t total, RenderContext context = RenderContext::standard());
    
    std::unique_ptr<Spinner> next(const std::string& name);
    void skip(const std::string& name);
    
    size_t current() const { return current_; }
    size_t total() const { return total_; }
    bool isComplete() const { return current_ >= total_; }
    
    static std::string stagePrefix(size_t current, size_t total);

private:
    size_t current_ = 0;
    size_t total_;
    RenderContext context_;
};

}}
