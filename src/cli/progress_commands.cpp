#include "progress_commands.hpp"
#include "pintui/common/logger.hpp"
#include "pintui/format/human_format.hpp"
#include "pintui/progress/progress_bar.hpp"
#include "pintui/progress/spinner.hpp"
#include "pintui/progress/stage_progress.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>
#include <thread>

namespace pintui {
namespace cli {

namespace {

using Clock = std::chrono::steady_clock;

std::string elapsedSince(Clock::time_point start) {
    return format::humanDuration(Clock::now() - start);
}

}

void SpinnerCommand::setup(CLI::App* subcommand) {
    markCalledOnParse(subcommand);
    subcommand->add_option("-m,--message", message_, "Spinner message");
    subcommand->add_option("-s,--seconds", seconds_, "How long the spinner runs")
        ->check(CLI::Range(0.0, 3600.0));
    subcommand->add_option("-o,--outcome", outcome_, "Final state")
        ->check(CLI::IsMember({"success", "error", "warn", "clear"}));
}

int SpinnerCommand::execute() {
    auto start = Clock::now();
    auto handle = progress::spinner(message_);
    
    auto half = std::chrono::duration<double>(seconds_ / 2.0);
    std::this_thread::sleep_for(half);
    handle->updateMessage(message_ + " (almost done)");
    std::this_thread::sleep_for(half);
    
    std::string summary = message_ + " in " + elapsedSince(start);
    if (outcome_ == "error") {
        handle->error(summary);
        return 1;
    } else if (outcome_ == "warn") {
        handle->warn(summary);
    } else if (outcome_ == "clear") {
        handle->clear();
    } else {
        handle->success(summary);
    }
    return 0;
}

void BarCommand::setup(CLI::App* subcommand) {
    markCalledOnParse(subcommand);
    subcommand->add_option("-t,--total", total_, "Total units of work");
    subcommand->add_option("-d,--delay-ms", delay_ms_, "Delay between updates")
        ->check(CLI::Range(0, 10000));
    subcommand->add_option("--description", description_, "Label shown before the bar");
    subcommand->add_option("--fail-at", fail_at_, "Fail once this many units are done (size syntax, e.g. 4KB)");
}

int BarCommand::execute() {
    uint64_t fail_threshold = 0;
    if (!fail_at_.empty()) {
        auto parsed = format::parseSize(fail_at_);
        if (!parsed) {
            std::cerr << "Invalid --fail-at value: " << parsed.error_message << "\n";
            return 2;
        }
        fail_threshold = *parsed.bytes;
    }
    
    auto start = Clock::now();
    auto progress_bar = progress::bar(total_, description_);
    
    for (uint64_t i = 0; i < total_; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        progress_bar->add(1);
        
        if (fail_threshold > 0 && progress_bar->current() >= fail_threshold) {
            progress_bar->error("Failed after " + format::humanSize(progress_bar->current()));
            return 1;
        }
    }
    
    progress_bar->success(format::pluralize(static_cast<long long>(total_), "unit", "units") +
                          " processed in " + elapsedSince(start));
    return 0;
}

void StagesCommand::setup(CLI::App* subcommand) {
    markCalledOnParse(subcommand);
    subcommand->add_option("--skip", skipped_, "1-based stage numbers to skip");
    subcommand->add_option("--stage-ms", stage_ms_, "Duration of each stage")
        ->check(CLI::Range(0, 60000));
}

int StagesCommand::execute() {
    static const std::array<const char*, 5> STAGES = {
        "Resolving", "Downloading", "Verifying", "Extracting", "Installing"
    };
    
    progress::StageProgress stages(STAGES.size());
    auto start = Clock::now();
    
    for (size_t i = 0; i < STAGES.size(); ++i) {
        bool skip = std::find(skipped_.begin(), skipped_.end(), i + 1) != skipped_.end();
        if (skip) {
            stages.skip(STAGES[i]);
            continue;
        }
        
        auto stage = stages.next(STAGES[i]);
        std::this_thread::sleep_for(std::chrono::milliseconds(stage_ms_));
        stage->success(std::string(STAGES[i]) + " done");
    }
    
    common::Logger::instance().info("[Demo] Stages complete | complete={} | elapsed={}",
                                    stages.isComplete(), elapsedSince(start));
    return stages.isComplete() ? 0 : 1;
}

}}
