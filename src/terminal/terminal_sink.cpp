#include "avance/terminal/terminal_sink.hpp"
#include "avance/terminal/terminal_info.hpp"
#include "avance/core/error_codes.hpp"
#include "avance/common/constants.hpp"
#include "avance/common/logger.hpp"
#include <iostream>
#include <unistd.h>

namespace avance {
namespace terminal {

namespace {
constexpr const char* CSI = "\033[";
}

TerminalSink::TerminalSink(std::ostream& out, bool ansi_enabled, int fd)
    : out_(out), ansi_enabled_(ansi_enabled), fd_(fd) {}

std::unique_ptr<TerminalSink> TerminalSink::forStderr() {
    return std::make_unique<TerminalSink>(std::cerr, isTerminal(STDERR_FILENO), STDERR_FILENO);
}

void TerminalSink::writeLine(const std::string& line) {
    if (ansi_enabled_) {
        clearCurrentLine();
    }
    buffer_ += line;
    buffer_ += '\n';
}

void TerminalSink::writeLines(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        writeLine(line);
    }
}

void TerminalSink::moveCursorUp(size_t n) {
    if (!ansi_enabled_ || n == 0) return;
    buffer_ += CSI + std::to_string(n) + "A\r";
}

void TerminalSink::moveCursorDown(size_t n) {
    if (!ansi_enabled_ || n == 0) return;
    buffer_ += CSI + std::to_string(n) + "B\r";
}

void TerminalSink::clearCurrentLine() {
    if (!ansi_enabled_) return;
    buffer_ += "\r";
    buffer_ += CSI;
    buffer_ += "2K";
}

bool TerminalSink::flush() {
    if (buffer_.empty()) {
        return !broken_;
    }

    try {
        writeBuffer();
    } catch (const core::SinkWriteError& e) {
        ++failed_writes_;
        buffer_.clear();
        if (!broken_) {
            common::Logger::instance().warn("[Sink] Write failed, keeping last frame | error={}", e.what());
        } else {
            common::Logger::instance().debug("[Sink] Write still failing | failures={}", failed_writes_);
        }
        broken_ = true;
        return false;
    }

    buffer_.clear();
    if (broken_) {
        common::Logger::instance().info("[Sink] Write recovered | failures={}", failed_writes_);
        broken_ = false;
    }
    return true;
}

void TerminalSink::writeBuffer() {
    try {
        out_.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        out_.flush();
    } catch (const std::ios_base::failure& e) {
        out_.clear();
        throw core::SinkWriteError(core::ProgressErrorCode::SINK_WRITE_FAILED, e.what());
    }

    if (!out_) {
        bool closed = out_.bad();
        out_.clear();
        throw core::SinkWriteError(closed ? core::ProgressErrorCode::SINK_CLOSED
                                          : core::ProgressErrorCode::SINK_WRITE_FAILED,
                                   std::to_string(buffer_.size()) + " bytes dropped");
    }
}

size_t TerminalSink::width() const {
    if (columns_override_) {
        return *columns_override_;
    }
    if (auto size = querySize(fd_)) {
        return size->columns;
    }
    return constants::render::DEFAULT_TERMINAL_WIDTH;
}

size_t TerminalSink::height() const {
    if (rows_override_) {
        return *rows_override_;
    }
    if (auto size = querySize(fd_); size && size->rows > 0) {
        return size->rows;
    }
    return constants::render::DEFAULT_TERMINAL_HEIGHT;
}

void TerminalSink::setSize(size_t columns, size_t rows) {
    columns_override_ = columns;
    rows_override_ = rows;
}

}}
