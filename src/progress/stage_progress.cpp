#include "pintui/progress/stage_progress.hpp"
#include "pintui/common/constants.hpp"
#include "pintui/common/logger.hpp"
#include "pintui/term/icons.hpp"
#include <spdlog/fmt/fmt.h>

namespace pintui {
namespace progress {

StageProgress::StageProgress(size_t total, RenderContext context)
    : total_(total),
      context_(context) {}

std::string StageProgress::stagePrefix(size_t current, size_t total) {
    return fmt::format("[{}/{}] ", current, total);
}

std::unique_ptr<Spinner> StageProgress::next(const std::string& name) {
    ++current_;
    
    if (current_ > total_) {
        common::Logger::instance().debug("[Stages] Past announced total | current={} | total={}",
                                         current_, total_);
    }
    
    auto handle = std::make_unique<Spinner>(name, context_, stagePrefix(current_, total_));
    handle->start();
    return handle;
}

void StageProgress::skip(const std::string& name) {
    ++current_;
    
    const auto& colors = *context_.colors;
    *context_.out << "  " << term::icons::skip(colors) << " " << stagePrefix(current_, total_)
                  << name << " " << colors.paint("(skipped)", constants::ansi::DIM) << "\n" << std::flush;
    
    common::Logger::instance().debug("[Stages] Skipped | name={} | current={} | total={}",
                                     name, current_, total_);
}

}}
