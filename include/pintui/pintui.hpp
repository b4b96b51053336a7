#pragma once

#include "common/config.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"
#include "format/human_format.hpp"
#include "progress/progress_bar.hpp"
#include "progress/spinner.hpp"
#include "progress/stage_progress.hpp"
#include "term/color_state.hpp"
#include "term/icons.hpp"
#include "term/terminal.hpp"
