#pragma once

#include "../core/style.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace avance {
namespace format {

struct BarSnapshot {
    uint64_t row_id = 0;
    uint64_t current = 0;
    std::optional<uint64_t> total;
    std::string description;
    std::string postfix;
    bool finished = false;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_update_time;
};

// Renders one display line from a snapshot. Pure: no clocks, no shared state.
// The result fits terminal_width columns unless the numeric fields alone are wider.
std::string formatLine(const BarSnapshot& snapshot,
                       std::chrono::duration<double> elapsed,
                       const core::StyleConfig& style,
                       size_t terminal_width);

// Percentage shown for current/total, clamped to [0, 100]. A zero total counts as complete.
unsigned percentComplete(uint64_t current, uint64_t total);

std::string renderBar(const std::string& glyphs, double fraction, size_t cells);
std::string renderAnimation(const std::string& glyphs, double elapsed_seconds, bool finished, size_t cells);

std::string formatHiddenRows(size_t hidden_count, size_t terminal_width);

}}
