#pragma once

#include "color_state.hpp"
#include <string>

namespace pintui {
namespace term {
namespace icons {

constexpr const char* OK = "✓";
constexpr const char* FAIL = "✗";
constexpr const char* WARN = "⚠";
constexpr const char* INFO = "ℹ";
constexpr const char* ARROW = "→";
constexpr const char* SKIP = "○";
constexpr const char* PENDING = "●";
constexpr const char* STAR = "★";

// Colored variants. Styling is applied only while the given ColorState is
// enabled; the bare glyph is returned otherwise.
std::string ok(const ColorState& colors = ColorState::global());
std::string fail(const ColorState& colors = ColorState::global());
std::string warn(const ColorState& colors = ColorState::global());
std::string info(const ColorState& colors = ColorState::global());
std::string arrow(const ColorState& colors = ColorState::global());
std::string skip(const ColorState& colors = ColorState::global());
std::string pending(const ColorState& colors = ColorState::global());
std::string star(const ColorState& colors = ColorState::global());

}}}
