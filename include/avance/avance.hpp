#pragma once

#include "common/constants.hpp"
#include "core/error_codes.hpp"
#include "core/style.hpp"
#include "core/bar_state.hpp"
#include "core/progress_bar.hpp"
#include "core/iter.hpp"
#include "render/bar_registry.hpp"

namespace avance {

using core::ProgressBar;
using core::StyleConfig;
using core::Style;
using core::LayoutMode;
using core::track;

}
