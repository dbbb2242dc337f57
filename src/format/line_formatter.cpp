#include "avance/format/line_formatter.hpp"
#include "avance/format/format_utils.hpp"
#include "avance/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace avance {
namespace format {

namespace {

std::string repeat(const std::string& unit, size_t count) {
    std::string out;
    out.reserve(unit.size() * count);
    for (size_t i = 0; i < count; ++i) {
        out += unit;
    }
    return out;
}

struct LineParts {
    std::string description;
    std::string left;
    std::string right;
    std::string postfix;
    std::string closing;
};

// Shrinks description, then postfix, until min_bar cells fit in budget. Returns the cells left for the bar.
size_t fitParts(LineParts& parts, size_t budget, size_t min_bar,
                const std::string& raw_description, const std::string& raw_postfix) {
    size_t desc_w = displayWidth(parts.description);
    size_t post_w = displayWidth(parts.postfix);

    if (desc_w + post_w + min_bar > budget && desc_w > 0) {
        size_t avail = budget > post_w + min_bar ? budget - post_w - min_bar : 0;
        parts.description = avail > 2 ? elideToWidth(raw_description, avail - 2) + ": " : "";
        desc_w = displayWidth(parts.description);
    }

    if (desc_w + post_w + min_bar > budget && post_w > 0) {
        size_t avail = budget > desc_w + min_bar ? budget - desc_w - min_bar : 0;
        parts.postfix = avail > 2 ? ", " + elideToWidth(raw_postfix, avail - 2) : "";
        post_w = displayWidth(parts.postfix);
    }

    return budget > desc_w + post_w ? budget - desc_w - post_w : 0;
}

}

unsigned percentComplete(uint64_t current, uint64_t total) {
    if (total == 0 || current >= total) {
        return 100;
    }
    long double ratio = static_cast<long double>(current) * 100.0L / static_cast<long double>(total);
    auto percent = static_cast<unsigned>(std::floor(ratio));
    return std::min(percent, 99u);
}

std::string renderBar(const std::string& glyphs, double fraction, size_t cells) {
    auto points = splitCodePoints(glyphs);
    if (points.empty() || cells == 0) {
        return std::string(cells, ' ');
    }

    fraction = std::clamp(fraction, 0.0, 1.0);

    if (points.size() == 1) {
        auto filled = std::min(cells, static_cast<size_t>(static_cast<double>(cells) * fraction));
        return repeat(points.front(), filled) + std::string(cells - filled, ' ');
    }

    size_t steps = points.size() - 1;
    auto total_steps = static_cast<size_t>(static_cast<double>(cells) * fraction * static_cast<double>(steps));
    total_steps = std::min(total_steps, cells * steps);

    size_t full = total_steps / steps;
    size_t partial = total_steps % steps;

    std::string bar = repeat(points.back(), full);
    if (full < cells) {
        bar += points[partial];
        bar += repeat(points.front(), cells - full - 1);
    }
    return bar;
}

std::string renderAnimation(const std::string& glyphs, double elapsed_seconds, bool finished, size_t cells) {
    if (cells == 0) {
        return "";
    }

    auto points = splitCodePoints(glyphs);
    std::string fill = points.empty() ? "#" : points.back();
    std::string empty = points.size() > 1 ? points.front() : " ";

    if (finished) {
        return repeat(fill, cells);
    }

    size_t block = std::min(constants::render::ANIMATION_BLOCK, cells);
    size_t span = cells - block;
    if (span == 0) {
        return repeat(fill, cells);
    }

    auto tick = static_cast<uint64_t>(std::max(0.0, elapsed_seconds) * constants::render::ANIMATION_CELLS_PER_SECOND);
    size_t pos = static_cast<size_t>(tick % (2 * span));
    if (pos > span) {
        pos = 2 * span - pos;
    }

    return repeat(empty, pos) + repeat(fill, block) + repeat(empty, cells - pos - block);
}

std::string formatLine(const BarSnapshot& snapshot,
                       std::chrono::duration<double> elapsed,
                       const core::StyleConfig& style,
                       size_t terminal_width) {
    size_t width = terminal_width > 0 ? terminal_width : constants::render::DEFAULT_TERMINAL_WIDTH;
    if (style.width && *style.width > 0) {
        width = std::min<size_t>(width, *style.width);
    }

    double seconds = std::max(0.0, elapsed.count());
    double rate = seconds > 0.0 ? static_cast<double>(snapshot.current) / seconds : -1.0;

    const std::string& unit = style.unit_label;
    std::string elapsed_text = formatTime(static_cast<uint64_t>(seconds));
    std::string rate_text = formatRate(rate, unit, style.unit_scale);

    LineParts parts;
    parts.description = snapshot.description.empty() ? "" : snapshot.description + ": ";
    parts.postfix = snapshot.postfix.empty() ? "" : ", " + snapshot.postfix;
    parts.closing = "]";

    if (snapshot.total) {
        uint64_t total = *snapshot.total;
        uint64_t current = snapshot.current;
        double fraction = total == 0 ? 1.0
                                     : std::min(1.0, static_cast<double>(current) / static_cast<double>(total));

        std::string eta;
        if (current >= total) {
            eta = formatTime(0);
        } else if (rate > 0.0) {
            double remaining = static_cast<double>(total - current) / rate;
            eta = formatTime(static_cast<uint64_t>(
                std::min(remaining, static_cast<double>(constants::render::MAX_ETA_SECONDS))));
        } else {
            eta = "?";
        }

        parts.left = fmt::format("{:>3}%|", percentComplete(current, total));
        parts.right = fmt::format("| {}/{} [{}<{}, {}",
                                  formatCount(current, style.unit_scale),
                                  formatCount(total, style.unit_scale),
                                  elapsed_text, eta, rate_text);

        size_t fixed = displayWidth(parts.left) + displayWidth(parts.right) + displayWidth(parts.closing);
        size_t budget = width > fixed ? width - fixed : 0;
        size_t cells = fitParts(parts, budget, constants::render::MIN_BAR_WIDTH,
                                snapshot.description, snapshot.postfix);

        return parts.description + parts.left + renderBar(style.bar_glyphs, fraction, cells) +
               parts.right + parts.postfix + parts.closing;
    }

    parts.left = formatCount(snapshot.current, style.unit_scale) + unit;
    parts.right = fmt::format(" [{}, {}", elapsed_text, rate_text);

    // " |" + animation + "|"
    const size_t frame = 3;
    size_t fixed = displayWidth(parts.left) + displayWidth(parts.right) + displayWidth(parts.closing);
    size_t budget = width > fixed ? width - fixed : 0;
    size_t room = fitParts(parts, budget, constants::render::ANIMATION_WIDTH + frame,
                           snapshot.description, snapshot.postfix);

    std::string animation;
    if (room > frame) {
        size_t cells = std::min(constants::render::ANIMATION_WIDTH, room - frame);
        animation = " |" + renderAnimation(style.bar_glyphs, seconds, snapshot.finished, cells) + "|";
    }

    return parts.description + parts.left + animation + parts.right + parts.postfix + parts.closing;
}

std::string formatHiddenRows(size_t hidden_count, size_t terminal_width) {
    return truncateToWidth(fmt::format("... ({} more hidden) ...", hidden_count), terminal_width);
}

}
}
