#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace pintui {
namespace term {

struct DisplayChar {
    size_t offset;
    size_t length;
    int width;
};

bool isTerminal(int fd);
int terminalWidth();
int terminalHeight();

int codepointWidth(char32_t codepoint);

// Splits UTF-8 text into characters with their column widths. Malformed
// bytes are kept as single one-column characters so nothing is dropped.
std::vector<DisplayChar> splitDisplayChars(const std::string& text);

// Columns occupied by text on a terminal. ANSI CSI sequences take no space.
int displayWidth(const std::string& text);

// Keeps the start of the text and appends "..." when it exceeds width.
// Escape sequences before the cut are kept, and a style left open by the
// cut is reset before the dots.
std::string truncateToWidth(const std::string& text, int width);

}}
