#pragma once

#include "../common/constants.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>

namespace avance {
namespace core {

enum class LayoutMode {
    STABLE,
    COMPACT
};

enum class Style {
    ASCII,
    BLOCK,
    BALLOON
};

std::string styleGlyphs(Style style);
std::optional<Style> parseStyle(const std::string& name);
std::optional<LayoutMode> parseLayoutMode(const std::string& name);
std::string toString(LayoutMode mode);

// Display parameters of one bar. Glyphs are UTF-8: the first code point is an
// empty cell, the last a filled cell, anything between a partial fill step.
struct StyleConfig {
    std::string bar_glyphs = constants::glyphs::ASCII;
    std::optional<uint16_t> width;
    std::chrono::milliseconds refresh_interval{constants::render::DEFAULT_REFRESH_INTERVAL_MS};
    std::string unit_label = constants::render::DEFAULT_UNIT;
    bool unit_scale = false;
    LayoutMode layout_mode = LayoutMode::STABLE;

    static StyleConfig fromStyle(Style style);

    StyleConfig& withGlyphs(std::string glyphs) { bar_glyphs = std::move(glyphs); return *this; }
    StyleConfig& withWidth(uint16_t w) { width = w; return *this; }
    StyleConfig& withRefreshInterval(std::chrono::milliseconds interval) { refresh_interval = interval; return *this; }
    StyleConfig& withUnit(std::string unit) { unit_label = std::move(unit); return *this; }
    StyleConfig& withUnitScale(bool scale) { unit_scale = scale; return *this; }
    StyleConfig& withLayout(LayoutMode mode) { layout_mode = mode; return *this; }
};

}}
