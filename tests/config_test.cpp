#include <gtest/gtest.h>
#include "pintui/common/config.hpp"
#include "pintui/progress/render_context.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace pintui::common;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("pintui_config_test_" + std::to_string(getpid()) + ".toml");
        Config::instance().reset();
    }
    
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        Config::instance().reset();
    }
    
    std::string write(const std::string& content) {
        std::ofstream file(path_);
        file << content;
        return path_.string();
    }
    
    std::filesystem::path path_;
};

}

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    GlobalConfig config = Config::createDefaultConfig();
    
    EXPECT_EQ(config.output.color, TriState::AUTO);
    EXPECT_EQ(config.progress.tick_interval_ms, 80);
    EXPECT_EQ(config.progress.bar_width, 40);
    EXPECT_EQ(config.progress.animate, TriState::AUTO);
    EXPECT_EQ(config.logging.level, LogLevel::WARN);
    EXPECT_EQ(config.logging.format, LogFormat::TEXT);
    EXPECT_TRUE(config.logging.file.empty());
    EXPECT_EQ(config.logging.rotation_size_mb, 10u);
    EXPECT_EQ(config.logging.max_files, 3u);
}

TEST_F(ConfigTest, FileOverridesDefaults) {
    std::string path = write(
        "[output]\n"
        "color = \"never\"\n"
        "\n"
        "[progress]\n"
        "tick_interval_ms = 50\n"
        "bar_width = 30\n"
        "animate = \"always\"\n"
        "\n"
        "[logging]\n"
        "level = \"debug\"\n"
        "file = \"/tmp/pintui.log\"\n"
        "format = \"json\"\n"
        "max_files = 5\n");
    
    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.currentConfigPath(), path);
    
    const auto& global = config.global();
    EXPECT_EQ(global.output.color, TriState::NEVER);
    EXPECT_EQ(global.progress.tick_interval_ms, 50);
    EXPECT_EQ(global.progress.bar_width, 30);
    EXPECT_EQ(global.progress.animate, TriState::ALWAYS);
    EXPECT_EQ(global.logging.level, LogLevel::DEBUG);
    EXPECT_EQ(global.logging.file, "/tmp/pintui.log");
    EXPECT_EQ(global.logging.format, LogFormat::JSON);
    EXPECT_EQ(global.logging.max_files, 5u);
    EXPECT_EQ(global.logging.rotation_size_mb, 10u);
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    std::string path = write(
        "[output]\n"
        "color = \"rainbow\"\n"
        "\n"
        "[progress]\n"
        "tick_interval_ms = 1\n"
        "bar_width = 0\n");
    
    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));
    
    EXPECT_EQ(config.global().output.color, TriState::AUTO);
    EXPECT_EQ(config.global().progress.tick_interval_ms, 80);
    EXPECT_EQ(config.global().progress.bar_width, 40);
}

TEST_F(ConfigTest, MalformedFileFailsAndKeepsDefaults) {
    std::string path = write("[progress\nbar_width = = 3\n");
    
    auto& config = Config::instance();
    EXPECT_FALSE(config.load(path));
    EXPECT_EQ(config.global().progress.bar_width, 40);
    EXPECT_TRUE(config.currentConfigPath().empty());
}

TEST_F(ConfigTest, WrongTypeFailsWithoutPartialApply) {
    std::string path = write(
        "[output]\n"
        "color = \"always\"\n"
        "\n"
        "[progress]\n"
        "bar_width = \"wide\"\n");
    
    auto& config = Config::instance();
    EXPECT_FALSE(config.load(path));
    EXPECT_EQ(config.global().output.color, TriState::AUTO);
}

TEST_F(ConfigTest, MissingExplicitFileFails) {
    EXPECT_FALSE(Config::instance().load("/nonexistent/pintui/config.toml"));
}

TEST_F(ConfigTest, ExplicitPathIsTheOnlyCandidate) {
    auto paths = Config::instance().getConfigSearchPaths("/etc/custom.toml");
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], "/etc/custom.toml");
}

TEST(ConfigParseTest, TriStateValues) {
    EXPECT_EQ(parseTriState("auto"), TriState::AUTO);
    EXPECT_EQ(parseTriState("Always"), TriState::ALWAYS);
    EXPECT_EQ(parseTriState("NEVER"), TriState::NEVER);
    EXPECT_EQ(parseTriState("off"), TriState::NEVER);
    EXPECT_FALSE(parseTriState("sometimes").has_value());
    EXPECT_EQ(to_string(TriState::ALWAYS), "always");
}

TEST(ConfigParseTest, LogLevels) {
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Info"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_FALSE(parseLogLevel("trace").has_value());
    EXPECT_EQ(to_string(LogLevel::DEBUG), "DEBUG");
}

TEST(ProgressOptionsTest, ExplicitAnimateModesIgnoreTerminal) {
    ProgressConfig config{25, 60, TriState::ALWAYS};
    auto options = pintui::progress::ProgressOptions::fromConfig(config);
    
    EXPECT_TRUE(options.animate);
    EXPECT_EQ(options.tick_interval, std::chrono::milliseconds(25));
    EXPECT_EQ(options.bar_width, 60);
    
    config.animate = TriState::NEVER;
    EXPECT_FALSE(pintui::progress::ProgressOptions::fromConfig(config).animate);
}
