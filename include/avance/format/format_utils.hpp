#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace avance {
namespace format {

// MM:SS below one hour, HH:MM:SS from there on.
std::string formatTime(uint64_t seconds);

// Three significant digits with an SI suffix: 1.23k, 12.3M, 999M, 1.00G.
std::string formatSizeof(double value);

std::string formatCount(uint64_t value, bool unit_scale);
std::string formatRate(double per_second, const std::string& unit, bool unit_scale);

std::string sanitizeControlCharacters(const std::string& text);
bool isControlCharacter(unsigned char c);
std::string getControlCharReplacement(unsigned char c);

// One entry per UTF-8 code point; each is treated as one terminal column.
std::vector<std::string> splitCodePoints(const std::string& text);
size_t displayWidth(const std::string& text);
std::string truncateToWidth(const std::string& text, size_t width);
std::string elideToWidth(const std::string& text, size_t width);

}
}
