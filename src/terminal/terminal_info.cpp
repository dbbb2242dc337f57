#include "avance/terminal/terminal_info.hpp"
#include <sys/ioctl.h>
#include <unistd.h>
#include <cstdlib>
#include <string>

namespace avance {
namespace terminal {

namespace {

std::optional<size_t> envDimension(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return std::nullopt;
    }
    try {
        long parsed = std::stol(value);
        if (parsed > 0) {
            return static_cast<size_t>(parsed);
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

}

bool isTerminal(int fd) {
    return fd >= 0 && isatty(fd);
}

std::optional<TerminalSize> querySize(int fd) {
    if (fd >= 0) {
        struct winsize w;
        if (ioctl(fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
            return TerminalSize{w.ws_col, w.ws_row > 0 ? static_cast<size_t>(w.ws_row) : 0};
        }
    }

    auto columns = envDimension("COLUMNS");
    if (!columns) {
        return std::nullopt;
    }
    return TerminalSize{*columns, envDimension("LINES").value_or(0)};
}

}}
