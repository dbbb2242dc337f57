#pragma once

#include <optional>
#include <cstddef>

namespace avance {
namespace terminal {

struct TerminalSize {
    size_t columns;
    size_t rows;
};

bool isTerminal(int fd);

// ioctl(TIOCGWINSZ) on fd, then $COLUMNS / $LINES, else nothing.
std::optional<TerminalSize> querySize(int fd);

}}
