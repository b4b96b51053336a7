#include "format_commands.hpp"
#include "pintui/common/constants.hpp"
#include "pintui/format/human_format.hpp"
#include "pintui/term/color_state.hpp"
#include "pintui/term/icons.hpp"
#include <chrono>
#include <iostream>

namespace pintui {
namespace cli {

void SizeCommand::setup(CLI::App* subcommand) {
    markCalledOnParse(subcommand);
    subcommand->require_subcommand(1);
    
    format_cmd_ = subcommand->add_subcommand("format", "Format byte counts as human-readable sizes");
    format_cmd_->add_option("bytes", byte_values_, "Byte counts")->required();
    
    parse_cmd_ = subcommand->add_subcommand("parse", "Parse size strings such as 1.5GB into bytes");
    parse_cmd_->add_option("sizes", size_strings_, "Size strings")->required();
}

int SizeCommand::execute() {
    if (format_cmd_->parsed()) {
        return executeFormat();
    }
    return executeParse();
}

int SizeCommand::executeFormat() {
    for (auto bytes : byte_values_) {
        std::cout << format::humanCount(bytes) << " bytes = " << format::humanSize(bytes) << "\n";
    }
    return 0;
}

int SizeCommand::executeParse() {
    auto& colors = term::ColorState::global();
    int failures = 0;
    
    for (const auto& text : size_strings_) {
        auto result = format::parseSize(text);
        if (result) {
            std::cout << term::icons::ok(colors) << " " << text << " = "
                      << format::pluralize(static_cast<long long>(*result.bytes), "byte", "bytes")
                      << " (" << format::humanSize(*result.bytes) << ")\n";
        } else {
            ++failures;
            std::cerr << term::icons::fail(colors) << " " << text << ": " << result.error_message
                      << colors.paint(" [" + common::formatContext(result.error_context) + "]",
                                      constants::ansi::DIM)
                      << "\n";
        }
    }
    
    return failures > 0 ? 1 : 0;
}

void DurationCommand::setup(CLI::App* subcommand) {
    markCalledOnParse(subcommand);
    subcommand->add_option("milliseconds", milliseconds_, "Durations in milliseconds")->required();
}

int DurationCommand::execute() {
    for (auto ms : milliseconds_) {
        std::cout << ms << "ms = " << format::humanDuration(std::chrono::milliseconds(ms)) << "\n";
    }
    return 0;
}

}}
