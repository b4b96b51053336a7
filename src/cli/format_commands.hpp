#pragma once

#include "main_command.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pintui {
namespace cli {

class SizeCommand : public MainCommand {
public:
    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    CLI::App* format_cmd_ = nullptr;
    CLI::App* parse_cmd_ = nullptr;
    std::vector<uint64_t> byte_values_;
    std::vector<std::string> size_strings_;
    
    int executeFormat();
    int executeParse();
};

class DurationCommand : public MainCommand {
public:
    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    std::vector<long long> milliseconds_;
};

}}
