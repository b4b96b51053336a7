#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "pintui/common/config.hpp"
#include "pintui/common/constants.hpp"
#include "pintui/common/logger.hpp"
#include "pintui/term/color_state.hpp"
#include "cli/format_commands.hpp"
#include "cli/progress_commands.hpp"

namespace {

void apply_color_mode(pintui::common::TriState mode) {
    auto& colors = pintui::term::ColorState::global();
    switch (mode) {
        case pintui::common::TriState::ALWAYS:
            colors.setColor(true);
            break;
        case pintui::common::TriState::NEVER:
            colors.setColor(false);
            break;
        case pintui::common::TriState::AUTO:
            colors.init();
            break;
    }
}

}

int main(int argc, char** argv) {
    try {
        CLI::App app{"Progress and formatting demo for the pintui terminal toolkit", "pintui-demo"};
        app.set_version_flag("--version,-v", pintui::constants::version::getFullVersion());
        app.require_subcommand(1);
        
        std::string config_path;
        std::string color_mode;
        std::string log_level;
        
        app.add_option("-c,--config", config_path, "Configuration file path");
        app.add_option("--color", color_mode, "Color output: auto, always or never")
            ->check(CLI::IsMember({"auto", "always", "never"}));
        app.add_option("--log-level", log_level, "Log level: error, warn, info or debug")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));
        
        std::vector<std::unique_ptr<pintui::cli::MainCommand>> commands;
        auto add_command = [&](std::unique_ptr<pintui::cli::MainCommand> command,
                               const char* name, const char* description) {
            command->setup(app.add_subcommand(name, description));
            commands.push_back(std::move(command));
        };
        
        add_command(std::make_unique<pintui::cli::SizeCommand>(), "size", "Format or parse byte sizes");
        add_command(std::make_unique<pintui::cli::DurationCommand>(), "duration", "Format durations");
        add_command(std::make_unique<pintui::cli::SpinnerCommand>(), "spinner", "Run an animated spinner");
        add_command(std::make_unique<pintui::cli::BarCommand>(), "bar", "Run a progress bar");
        add_command(std::make_unique<pintui::cli::StagesCommand>(), "stages", "Run a multi-stage sequence");
        
        CLI11_PARSE(app, argc, argv);
        
        auto& config = pintui::common::Config::instance();
        bool config_ok = config.load(config_path);
        
        auto& global = config.global();
        if (!log_level.empty()) {
            if (auto level = pintui::common::parseLogLevel(log_level)) {
                global.logging.level = *level;
            }
        }
        if (!color_mode.empty()) {
            if (auto mode = pintui::common::parseTriState(color_mode)) {
                global.output.color = *mode;
            }
        }
        
        pintui::common::Logger::instance().initialize(global.logging);
        
        if (!config_ok) {
            std::cerr << "Warning: configuration not loaded from "
                      << (config_path.empty() ? "default location" : config_path)
                      << ", using defaults\n";
        }
        
        apply_color_mode(global.output.color);
        
        int exit_code = 0;
        for (auto& command : commands) {
            if (command->wasCalled()) {
                exit_code = command->execute();
                break;
            }
        }
        
        pintui::common::Logger::instance().shutdown();
        return exit_code;
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
