#include "avance/core/style.hpp"
#include <algorithm>
#include <cctype>

namespace avance {
namespace core {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}

std::string styleGlyphs(Style style) {
    switch (style) {
        case Style::ASCII: return constants::glyphs::ASCII;
        case Style::BLOCK: return constants::glyphs::BLOCK;
        case Style::BALLOON: return constants::glyphs::BALLOON;
    }
    return constants::glyphs::ASCII;
}

std::optional<Style> parseStyle(const std::string& name) {
    std::string key = lowercase(name);
    if (key == "ascii") return Style::ASCII;
    if (key == "block") return Style::BLOCK;
    if (key == "balloon") return Style::BALLOON;
    return std::nullopt;
}

std::optional<LayoutMode> parseLayoutMode(const std::string& name) {
    std::string key = lowercase(name);
    if (key == "stable") return LayoutMode::STABLE;
    if (key == "compact") return LayoutMode::COMPACT;
    return std::nullopt;
}

std::string toString(LayoutMode mode) {
    return mode == LayoutMode::COMPACT ? "compact" : "stable";
}

StyleConfig StyleConfig::fromStyle(Style style) {
    StyleConfig config;
    config.bar_glyphs = styleGlyphs(style);
    return config;
}

}}
