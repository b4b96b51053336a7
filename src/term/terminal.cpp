#include "pintui/term/terminal.hpp"
#include "pintui/common/constants.hpp"
#include <algorithm>
#include <locale.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <wchar.h>

namespace pintui {
namespace term {

namespace {

struct Range {
    char32_t first;
    char32_t last;
};

constexpr Range ZERO_WIDTH_RANGES[] = {
    {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x0610, 0x061A},
    {0x064B, 0x065F}, {0x0E31, 0x0E31}, {0x0E34, 0x0E3A}, {0x1AB0, 0x1AFF},
    {0x1DC0, 0x1DFF}, {0x200B, 0x200F}, {0x20D0, 0x20FF}, {0xFE00, 0xFE0F},
    {0xFE20, 0xFE2F}, {0xE0100, 0xE01EF},
};

constexpr Range WIDE_RANGES[] = {
    {0x1100, 0x115F}, {0x2E80, 0x303E}, {0x3041, 0x33FF}, {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF}, {0xA000, 0xA4CF}, {0xAC00, 0xD7A3}, {0xF900, 0xFAFF},
    {0xFE30, 0xFE4F}, {0xFF00, 0xFF60}, {0xFFE0, 0xFFE6}, {0x1F300, 0x1F64F},
    {0x1F900, 0x1F9FF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};

template<size_t N>
bool inRanges(char32_t codepoint, const Range (&ranges)[N]) {
    for (const auto& range : ranges) {
        if (codepoint >= range.first && codepoint <= range.last) {
            return true;
        }
    }
    return false;
}

locale_t utf8Locale() {
    static locale_t locale = [] {
        locale_t loc = newlocale(LC_CTYPE_MASK, "C.UTF-8", static_cast<locale_t>(0));
        if (loc == static_cast<locale_t>(0)) {
            loc = newlocale(LC_CTYPE_MASK, "en_US.UTF-8", static_cast<locale_t>(0));
        }
        return loc;
    }();
    return locale;
}

// wcwidth() only knows multi-byte widths under a UTF-8 locale; switch to one
// for this thread instead of depending on the host program's setlocale().
int systemWidth(char32_t codepoint) {
    locale_t locale = utf8Locale();
    if (locale == static_cast<locale_t>(0)) {
        return -1;
    }
    locale_t previous = uselocale(locale);
    int width = wcwidth(static_cast<wchar_t>(codepoint));
    uselocale(previous);
    return width;
}

size_t decodeUtf8(const std::string& text, size_t pos, char32_t& codepoint) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    
    size_t utf8_len = 0;
    if (c < 0x80) {
        codepoint = c;
        return 1;
    } else if ((c & 0xE0) == 0xC0) {
        utf8_len = 2;
        codepoint = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        utf8_len = 3;
        codepoint = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        utf8_len = 4;
        codepoint = c & 0x07;
    } else {
        return 0;
    }
    
    if (pos + utf8_len > text.length()) {
        return 0;
    }
    
    for (size_t j = 1; j < utf8_len; ++j) {
        unsigned char next = static_cast<unsigned char>(text[pos + j]);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        codepoint = (codepoint << 6) | (next & 0x3F);
    }
    
    return utf8_len;
}

size_t skipEscapeSequence(const std::string& text, size_t pos) {
    size_t i = pos + 1;
    if (i < text.length() && text[i] == '[') {
        ++i;
        while (i < text.length()) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            ++i;
            if (c >= 0x40 && c <= 0x7E) {
                break;
            }
        }
        return i;
    }
    return std::min(i + 1, text.length());
}

// SGR: "\033[" parameters "m".
bool isStyleSequence(const std::string& text, size_t begin, size_t end) {
    return end - begin >= 3 && text[begin + 1] == '[' && text[end - 1] == 'm';
}

bool isResetSequence(const std::string& text, size_t begin, size_t end) {
    std::string params = text.substr(begin + 2, end - begin - 3);
    return params.empty() || params.find_first_not_of('0') == std::string::npos;
}

}

bool isTerminal(int fd) {
    return isatty(fd) != 0;
}

int terminalWidth() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return constants::terminal::DEFAULT_WIDTH;
}

int terminalHeight() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_row > 0) {
        return w.ws_row;
    }
    return constants::terminal::DEFAULT_HEIGHT;
}

int codepointWidth(char32_t codepoint) {
    if (codepoint == 0) return 0;
    if (codepoint < 0x20 || (codepoint >= 0x7F && codepoint < 0xA0)) return 0;
    if (codepoint < 0x7F) return 1;
    
    if (inRanges(codepoint, ZERO_WIDTH_RANGES)) return 0;
    if (inRanges(codepoint, WIDE_RANGES)) return 2;
    
    int width = systemWidth(codepoint);
    return width >= 0 ? width : 1;
}

std::vector<DisplayChar> splitDisplayChars(const std::string& text) {
    std::vector<DisplayChar> chars;
    chars.reserve(text.length());
    
    size_t pos = 0;
    while (pos < text.length()) {
        char32_t codepoint = 0;
        size_t len = decodeUtf8(text, pos, codepoint);
        
        if (len == 0) {
            chars.push_back({pos, 1, 1});
            ++pos;
        } else {
            chars.push_back({pos, len, codepointWidth(codepoint)});
            pos += len;
        }
    }
    
    return chars;
}

int displayWidth(const std::string& text) {
    int width = 0;
    size_t pos = 0;
    
    while (pos < text.length()) {
        if (text[pos] == '\033') {
            pos = skipEscapeSequence(text, pos);
            continue;
        }
        
        char32_t codepoint = 0;
        size_t len = decodeUtf8(text, pos, codepoint);
        if (len == 0) {
            width += 1;
            pos += 1;
        } else {
            width += codepointWidth(codepoint);
            pos += len;
        }
    }
    
    return width;
}

std::string truncateToWidth(const std::string& text, int width) {
    if (width <= 0) {
        return "";
    }
    if (displayWidth(text) <= width) {
        return text;
    }
    if (width <= 3) {
        return std::string(static_cast<size_t>(width), '.');
    }
    
    int budget = width - 3;
    int used = 0;
    size_t pos = 0;
    size_t end = 0;
    bool style_open = false;
    
    // Escape sequences are copied whole and cost no columns.
    while (pos < text.length()) {
        if (text[pos] == '\033') {
            size_t next = skipEscapeSequence(text, pos);
            if (isStyleSequence(text, pos, next)) {
                style_open = !isResetSequence(text, pos, next);
            }
            pos = next;
            end = pos;
            continue;
        }
        
        char32_t codepoint = 0;
        size_t len = decodeUtf8(text, pos, codepoint);
        int char_width = 1;
        if (len == 0) {
            len = 1;
        } else {
            char_width = codepointWidth(codepoint);
        }
        
        if (used + char_width > budget) {
            break;
        }
        used += char_width;
        pos += len;
        end = pos;
    }
    
    std::string result = text.substr(0, end);
    if (style_open) {
        result += constants::ansi::RESET;
    }
    return result + "...";
}

}}
