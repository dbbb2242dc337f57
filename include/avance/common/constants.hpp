#pragma once

#include <string>
#include <array>
#include <cstdint>
#include <cstddef>

namespace avance {
namespace constants {

namespace version {
    constexpr const char* LIBRARY_VERSION = "0.4.0";

    inline std::string getFullVersion() {
        return std::string("avance v") + LIBRARY_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "avance";
    constexpr const char* CLI_NAME = "avc";
    constexpr const char* LOGGER_NAME = "avance";
    constexpr const char* CONFIG_ENV = "AVANCE_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "avance.toml";
}

namespace glyphs {
    constexpr const char* ASCII = " 123456789#";
    constexpr const char* BLOCK = " ▏▎▍▌▋▊▉█";
    constexpr const char* BALLOON = " .oO@*";

    constexpr std::array<const char*, 3> STYLE_NAMES = {"ascii", "block", "balloon"};
}

namespace render {
    constexpr int64_t DEFAULT_REFRESH_INTERVAL_MS = 1000 / 15;
    constexpr size_t DEFAULT_TERMINAL_WIDTH = 80;
    constexpr size_t DEFAULT_TERMINAL_HEIGHT = 24;
    constexpr size_t DEFAULT_MAX_ROWS = 20;
    constexpr size_t MIN_MAX_ROWS = 2;
    constexpr size_t MIN_BAR_WIDTH = 10;
    // Longer estimates are shown as 99:59:59.
    constexpr uint64_t MAX_ETA_SECONDS = 99 * 3600 + 59 * 60 + 59;
    constexpr size_t ANIMATION_WIDTH = 10;
    constexpr size_t ANIMATION_BLOCK = 3;
    constexpr double ANIMATION_CELLS_PER_SECOND = 8.0;
    constexpr const char* ELLIPSIS = "...";
    constexpr const char* DEFAULT_UNIT = "it";
}

namespace config_defaults {
    constexpr const char* LOG_LEVEL = "WARN";
    constexpr size_t LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t LOG_MAX_FILES = 3;

    constexpr const char* DISPLAY_STYLE = "ascii";
    constexpr const char* DISPLAY_LAYOUT = "stable";
    constexpr int64_t REFRESH_INTERVAL_MS = render::DEFAULT_REFRESH_INTERVAL_MS;
    constexpr size_t MAX_ROWS = render::DEFAULT_MAX_ROWS;
}

}
}
