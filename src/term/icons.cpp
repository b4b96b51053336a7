#include "pintui/term/icons.hpp"
#include "pintui/common/constants.hpp"

namespace pintui {
namespace term {
namespace icons {

using namespace constants::ansi;

std::string ok(const ColorState& colors) { return colors.paint(OK, GREEN); }
std::string fail(const ColorState& colors) { return colors.paint(FAIL, RED); }
std::string warn(const ColorState& colors) { return colors.paint(WARN, YELLOW); }
std::string info(const ColorState& colors) { return colors.paint(INFO, BLUE); }
std::string arrow(const ColorState& colors) { return colors.paint(ARROW, CYAN); }
std::string skip(const ColorState& colors) { return colors.paint(SKIP, DIM); }
std::string pending(const ColorState& colors) { return colors.paint(PENDING, YELLOW); }
std::string star(const ColorState& colors) { return colors.paint(STAR, GREEN); }

}}}
