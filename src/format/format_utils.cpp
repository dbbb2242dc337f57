#include "avance/format/format_utils.hpp"
#include "avance/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <iomanip>
#include <array>

namespace avance {
namespace format {

namespace {

size_t sequenceLength(unsigned char lead) {
    if ((lead & 0x80) == 0) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}

std::string formatTime(uint64_t seconds) {
    uint64_t minutes = seconds / 60 % 60;
    uint64_t secs = seconds % 60;
    uint64_t hours = seconds / 3600;

    if (hours == 0) {
        return fmt::format("{:02}:{:02}", minutes, secs);
    }
    return fmt::format("{:02}:{:02}:{:02}", hours, minutes, secs);
}

std::string formatSizeof(double value) {
    static const std::array<const char*, 8> units = {"", "k", "M", "G", "T", "P", "E", "Z"};

    double num = value;
    for (const char* unit : units) {
        if (num < 999.5) {
            if (num < 99.95) {
                if (num < 9.995) {
                    return fmt::format("{:.2f}{}", num, unit);
                }
                return fmt::format("{:.1f}{}", num, unit);
            }
            return fmt::format("{:.0f}{}", num, unit);
        }
        num /= 1000.0;
    }
    return fmt::format("{:.1f}Y", num);
}

std::string formatCount(uint64_t value, bool unit_scale) {
    if (unit_scale) {
        return formatSizeof(static_cast<double>(value));
    }
    return std::to_string(value);
}

std::string formatRate(double per_second, const std::string& unit, bool unit_scale) {
    if (per_second < 0.0 || per_second != per_second) {
        return fmt::format("?{}/s", unit);
    }
    if (unit_scale) {
        return fmt::format("{}{}/s", formatSizeof(per_second), unit);
    }
    return fmt::format("{:.2f}{}/s", per_second, unit);
}

std::string sanitizeControlCharacters(const std::string& text) {
    std::ostringstream result;

    for (size_t i = 0; i < text.length(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (isControlCharacter(c)) {
            result << getControlCharReplacement(c);
        } else if ((c & 0x80) != 0) {
            size_t utf8_len = sequenceLength(c);

            if (utf8_len > 1 && i + utf8_len <= text.length()) {
                bool valid = true;
                for (size_t j = 1; j < utf8_len; ++j) {
                    if (!isContinuation(static_cast<unsigned char>(text[i + j]))) {
                        valid = false;
                        break;
                    }
                }

                if (valid) {
                    result.write(text.data() + i, static_cast<std::streamsize>(utf8_len));
                    i += utf8_len - 1;
                } else {
                    result << "\uFFFD";
                }
            } else {
                result << "\uFFFD";
            }
        } else {
            result << c;
        }
    }

    return result.str();
}

// Line breaks and tabs count as control characters here: a bar is exactly one terminal row.
bool isControlCharacter(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

std::string getControlCharReplacement(unsigned char c) {
    std::ostringstream oss;
    oss << "<" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(c) << ">";
    return oss.str();
}

std::vector<std::string> splitCodePoints(const std::string& text) {
    std::vector<std::string> points;
    size_t i = 0;
    while (i < text.size()) {
        size_t len = sequenceLength(static_cast<unsigned char>(text[i]));
        if (len == 0 || i + len > text.size()) {
            len = 1;
        }
        points.push_back(text.substr(i, len));
        i += len;
    }
    return points;
}

size_t displayWidth(const std::string& text) {
    size_t width = 0;
    for (unsigned char c : text) {
        if (!isContinuation(c)) {
            ++width;
        }
    }
    return width;
}

std::string truncateToWidth(const std::string& text, size_t width) {
    if (displayWidth(text) <= width) {
        return text;
    }
    std::string result;
    size_t used = 0;
    for (const auto& point : splitCodePoints(text)) {
        if (used == width) break;
        result += point;
        ++used;
    }
    return result;
}

std::string elideToWidth(const std::string& text, size_t width) {
    if (displayWidth(text) <= width) {
        return text;
    }
    const std::string marker = constants::render::ELLIPSIS;
    size_t marker_width = displayWidth(marker);
    if (width <= marker_width) {
        return truncateToWidth(marker, width);
    }
    return truncateToWidth(text, width - marker_width) + marker;
}

}
}
