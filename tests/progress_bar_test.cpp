#include <gtest/gtest.h>
#include "pintui/progress/progress_bar.hpp"
#include "pintui/term/terminal.hpp"
#include <cstdint>
#include <limits>
#include <sstream>

using namespace pintui::progress;
using pintui::term::ColorState;

namespace {

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.length() >= suffix.length() &&
           text.compare(text.length() - suffix.length(), suffix.length(), suffix) == 0;
}

class ProgressBarTest : public ::testing::Test {
protected:
    RenderContext context(bool animate = true, int bar_width = 10, int line_width = 0) {
        ProgressOptions options;
        options.bar_width = bar_width;
        options.animate = animate;
        options.line_width = line_width;
        return RenderContext::forStreams(out, err, colors, options);
    }
    
    std::ostringstream out;
    std::ostringstream err;
    ColorState colors{false};
};

}

TEST_F(ProgressBarTest, EmptyBarIsAllPadding) {
    ProgressBar progress(100, "Test", context());
    EXPECT_EQ(progress.renderLine(), "Test [──────────] 0/100");
    EXPECT_DOUBLE_EQ(progress.percentage(), 0.0);
}

TEST_F(ProgressBarTest, HalfBarHasHeadGlyph) {
    ProgressBar progress(100, "Test", context());
    progress.set(50);
    
    EXPECT_EQ(progress.renderLine(), "Test [━━━━━╸────] 50/100");
    EXPECT_DOUBLE_EQ(progress.percentage(), 0.5);
}

TEST_F(ProgressBarTest, SmallProgressShowsOnlyHead) {
    ProgressBar progress(100, "Test", context());
    progress.set(1);
    EXPECT_EQ(progress.renderLine(), "Test [╸─────────] 1/100");
}

TEST_F(ProgressBarTest, FullBarHasNoHead) {
    ProgressBar progress(100, "Test", context());
    progress.set(100);
    EXPECT_EQ(progress.renderLine(), "Test [━━━━━━━━━━] 100/100");
}

TEST_F(ProgressBarTest, OverflowIsClampedInRendering) {
    ProgressBar progress(100, "Test", context());
    progress.set(150);
    
    EXPECT_EQ(progress.current(), 150u);
    EXPECT_DOUBLE_EQ(progress.percentage(), 1.0);
    EXPECT_EQ(progress.renderLine(), "Test [━━━━━━━━━━] 100/100");
}

TEST_F(ProgressBarTest, ZeroTotalIsComplete) {
    ProgressBar progress(0, "Nothing", context());
    EXPECT_DOUBLE_EQ(progress.percentage(), 1.0);
    EXPECT_EQ(progress.renderLine(), "Nothing [━━━━━━━━━━] 0/0");
}

TEST_F(ProgressBarTest, EmptyDescriptionOmitsLeadingSpace) {
    ProgressBar progress(5, "", context());
    EXPECT_EQ(progress.renderLine(), "[──────────] 0/5");
}

TEST_F(ProgressBarTest, AddAccumulatesAndRedraws) {
    ProgressBar progress(100, "Test", context());
    progress.add(30);
    progress.add(20);
    
    EXPECT_EQ(progress.current(), 50u);
    EXPECT_TRUE(endsWith(out.str(), "\rTest [━━━━━╸────] 50/100\033[K"));
    EXPECT_EQ(out.str().find("\rTest [━━━╸──────] 30/100\033[K"), 0u);
}

TEST_F(ProgressBarTest, AddSaturates) {
    ProgressBar progress(10, "Test", context(false));
    progress.set(std::numeric_limits<uint64_t>::max() - 1);
    progress.add(10);
    EXPECT_EQ(progress.current(), std::numeric_limits<uint64_t>::max());
}

TEST_F(ProgressBarTest, SuccessErasesAndPrints) {
    ProgressBar progress(10, "Copy", context());
    progress.add(10);
    progress.success("Copied");
    
    EXPECT_TRUE(endsWith(out.str(), "\r\033[K✓ Copied\n"));
    EXPECT_TRUE(progress.isFinished());
}

TEST_F(ProgressBarTest, UpdatesAfterFinishAreIgnored) {
    ProgressBar progress(10, "Copy", context());
    progress.add(5);
    progress.success("Copied");
    
    std::string snapshot = out.str();
    progress.add(3);
    progress.set(9);
    progress.success("Again");
    
    EXPECT_EQ(progress.current(), 5u);
    EXPECT_EQ(out.str(), snapshot);
}

TEST_F(ProgressBarTest, ErrorGoesToErrorStream) {
    ProgressBar progress(10, "Upload", context());
    progress.add(4);
    progress.error("Upload failed");
    
    EXPECT_EQ(err.str(), "✗ Upload failed\n");
    EXPECT_TRUE(endsWith(out.str(), "\r\033[K"));
}

TEST_F(ProgressBarTest, ClearWritesNoFinalLine) {
    ProgressBar progress(10, "Scan", context());
    progress.add(2);
    progress.clear();
    
    EXPECT_TRUE(endsWith(out.str(), "\r\033[K"));
    EXPECT_EQ(out.str().find('\n'), std::string::npos);
}

TEST_F(ProgressBarTest, WithoutAnimationOnlyFinalLineIsWritten) {
    ProgressBar progress(10, "Quiet", context(false));
    progress.add(5);
    EXPECT_TRUE(out.str().empty());
    
    progress.success("Done");
    EXPECT_EQ(out.str(), "✓ Done\n");
}

TEST_F(ProgressBarTest, ColoredBarStylesFilledAndPadding) {
    colors.setColor(true);
    ProgressBar progress(100, "Test", context());
    progress.set(50);
    
    std::string line = progress.renderLine();
    EXPECT_NE(line.find("\033[36m━━━━━╸\033[0m"), std::string::npos);
    EXPECT_NE(line.find("\033[34m────\033[0m"), std::string::npos);
}

TEST_F(ProgressBarTest, LongDescriptionIsTruncatedToLineWidth) {
    ProgressBar progress(100, "Downloading a very long artifact name", context(true, 10, 30));
    progress.set(50);
    
    std::string line = progress.renderLine();
    EXPECT_EQ(line, "Downlo... [━━━━━╸────] 50/100");
    EXPECT_LE(pintui::term::displayWidth(line), 29);
}

TEST_F(ProgressBarTest, BarNarrowsBeforeOverflowingLineWidth) {
    ProgressBar progress(100, "Downloading a very long artifact name", context(true, 40, 30));
    progress.set(50);
    
    EXPECT_EQ(progress.renderLine(), "[━━━━━━━━━━╸─────────] 50/100");
    EXPECT_TRUE(endsWith(out.str(), "\r[━━━━━━━━━━╸─────────] 50/100\033[K"));
}

TEST_F(ProgressBarTest, ShortLinesKeepFullDescription) {
    ProgressBar progress(100, "Copy", context(true, 10, 80));
    progress.set(50);
    EXPECT_EQ(progress.renderLine(), "Copy [━━━━━╸────] 50/100");
}

TEST_F(ProgressBarTest, DestroyingDrawnBarClearsLine) {
    {
        auto progress = bar(10, "Scoped", context());
        progress->add(1);
    }
    EXPECT_TRUE(endsWith(out.str(), "\r\033[K"));
}
