#pragma once

#include "main_command.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pintui {
namespace cli {

class SpinnerCommand : public MainCommand {
public:
    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    std::string message_ = "Working...";
    double seconds_ = 2.0;
    std::string outcome_ = "success";
};

class BarCommand : public MainCommand {
public:
    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    uint64_t total_ = 100;
    int delay_ms_ = 20;
    std::string description_ = "Processing";
    std::string fail_at_;
};

class StagesCommand : public MainCommand {
public:
    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    std::vector<size_t> skipped_;
    int stage_ms_ = 600;
};

}}
