#include <gtest/gtest.h>
#include "pintui/term/color_state.hpp"
#include <map>
#include <string>

using pintui::term::ColorState;

namespace {

class FakeEnvironment {
public:
    FakeEnvironment& set(const std::string& name, const std::string& value) {
        vars_[name] = value;
        return *this;
    }
    
    ColorState::EnvLookup lookup() const {
        return [this](const char* name) -> const char* {
            auto it = vars_.find(name);
            return it == vars_.end() ? nullptr : it->second.c_str();
        };
    }

private:
    std::map<std::string, std::string> vars_;
};

}

TEST(ColorStateTest, FollowsTerminalWithoutVariables) {
    FakeEnvironment env;
    EXPECT_TRUE(ColorState::detect(env.lookup(), true));
    EXPECT_FALSE(ColorState::detect(env.lookup(), false));
}

TEST(ColorStateTest, NoColorWinsOverEverything) {
    FakeEnvironment env;
    env.set("NO_COLOR", "1").set("CLICOLOR_FORCE", "1").set("CLICOLOR", "1");
    EXPECT_FALSE(ColorState::detect(env.lookup(), true));
}

TEST(ColorStateTest, EmptyNoColorIsIgnored) {
    FakeEnvironment env;
    env.set("NO_COLOR", "");
    EXPECT_TRUE(ColorState::detect(env.lookup(), true));
}

TEST(ColorStateTest, ForceEnablesOffTerminal) {
    FakeEnvironment env;
    env.set("CLICOLOR_FORCE", "1").set("CLICOLOR", "0");
    EXPECT_TRUE(ColorState::detect(env.lookup(), false));
}

TEST(ColorStateTest, ForceZeroFallsThrough) {
    FakeEnvironment forced_off;
    forced_off.set("CLICOLOR_FORCE", "0");
    EXPECT_FALSE(ColorState::detect(forced_off.lookup(), false));
    EXPECT_TRUE(ColorState::detect(forced_off.lookup(), true));
    
    FakeEnvironment empty_force;
    empty_force.set("CLICOLOR_FORCE", "");
    EXPECT_FALSE(ColorState::detect(empty_force.lookup(), false));
}

TEST(ColorStateTest, CliColorOverridesTerminalDetection) {
    FakeEnvironment disabled;
    disabled.set("CLICOLOR", "0");
    EXPECT_FALSE(ColorState::detect(disabled.lookup(), true));
    
    FakeEnvironment enabled;
    enabled.set("CLICOLOR", "1");
    EXPECT_TRUE(ColorState::detect(enabled.lookup(), false));
}

TEST(ColorStateTest, InitAppliesDetection) {
    ColorState colors(true);
    FakeEnvironment env;
    env.set("NO_COLOR", "1");
    
    colors.init(env.lookup(), true);
    EXPECT_FALSE(colors.enabled());
}

TEST(ColorStateTest, SetColorOverridesUntilChanged) {
    ColorState colors;
    EXPECT_FALSE(colors.enabled());
    
    colors.setColor(true);
    EXPECT_TRUE(colors.enabled());
    
    colors.setColor(false);
    EXPECT_FALSE(colors.enabled());
}

TEST(ColorStateTest, PaintReadsCurrentState) {
    ColorState colors(false);
    EXPECT_EQ(colors.paint("text", "\033[32m"), "text");
    
    colors.setColor(true);
    EXPECT_EQ(colors.paint("text", "\033[32m"), "\033[32mtext\033[0m");
    EXPECT_EQ(colors.paint("text", ""), "text");
}

TEST(ColorStateTest, GlobalIsSingleInstance) {
    EXPECT_EQ(&ColorState::global(), &ColorState::global());
}
