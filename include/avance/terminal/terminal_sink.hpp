#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace avance {
namespace terminal {

// Buffered writer over one output stream. All cursor control goes through
// here; nothing else emits escape sequences. Not thread-safe: the registry
// only touches it from inside a redraw pass.
//
// With ANSI disabled (the stream is not a terminal) cursor movement and line
// clearing are dropped and only plain lines are written.
class TerminalSink {
public:
    TerminalSink(std::ostream& out, bool ansi_enabled, int fd = -1);

    static std::unique_ptr<TerminalSink> forStderr();

    void writeLine(const std::string& line);
    void writeLines(const std::vector<std::string>& lines);
    void moveCursorUp(size_t n);
    void moveCursorDown(size_t n);
    void clearCurrentLine();

    // Pushes buffered output to the stream in one write. A failed write is
    // logged and reported through the return value, never thrown.
    bool flush();

    bool ansiEnabled() const { return ansi_enabled_; }
    bool healthy() const { return !broken_; }
    uint64_t failedWrites() const { return failed_writes_; }

    size_t width() const;
    size_t height() const;
    void setSize(size_t columns, size_t rows);

private:
    void writeBuffer();

    std::ostream& out_;
    bool ansi_enabled_;
    int fd_;
    std::string buffer_;
    bool broken_ = false;
    uint64_t failed_writes_ = 0;
    std::optional<size_t> columns_override_;
    std::optional<size_t> rows_override_;
};

}}
