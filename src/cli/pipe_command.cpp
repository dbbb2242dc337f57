#include "pipe_command.hpp"
#include "avance/core/progress_bar.hpp"
#include "avance/core/error_codes.hpp"
#include "avance/common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>
#include <unistd.h>

namespace avance {
namespace cli {

namespace {

constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

bool writeAll(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
    return true;
}

}

PipeCommand::PipeCommand() = default;

void PipeCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("--total", total_,
                           "Number of expected iterations; without it only counts and rates are shown");
    subcommand->add_option("--delim", delim_,
                           "Delimiting character (default: '\\n')");
    subcommand->add_option("--desc", description_, "Bar description");
    subcommand->add_flag("--bytes", bytes_, "Count bytes instead of delimited items");
    addStyleOptions(subcommand);

    subcommand->callback([this]() { was_called_ = true; });
}

std::optional<char> PipeCommand::parseDelimiter(const std::string& text) {
    if (text.size() == 1) {
        return text[0];
    }
    if (text == "\\n") return '\n';
    if (text == "\\t") return '\t';
    if (text == "\\r") return '\r';
    if (text == "\\0") return '\0';
    if (text == "\\\\") return '\\';
    return std::nullopt;
}

int PipeCommand::execute() {
    auto delimiter = parseDelimiter(delim_);
    if (!delimiter) {
        std::cerr << "Error: --delim must be a single character or one of \\n \\t \\r \\0\n";
        return 1;
    }

    core::StyleConfig style;
    try {
        style = resolveStyle(style_name_, layout_name_);
    } catch (const core::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    if (bytes_) {
        style.withUnit("B").withUnitScale(true);
    }

    common::Logger::instance().debug("[Pipe] Started | total={} | bytes={}",
                                     total_ ? std::to_string(*total_) : std::string("none"), bytes_);

    core::ProgressBar bar(total_, description_, style);
    std::vector<char> buffer(READ_CHUNK_SIZE);
    uint64_t items = 0;
    int status = 0;

    while (true) {
        ssize_t got = ::read(STDIN_FILENO, buffer.data(), buffer.size());
        if (got < 0) {
            if (errno == EINTR) continue;
            common::Logger::instance().error("[Pipe] Read failed | error={}", std::strerror(errno));
            status = 1;
            break;
        }
        if (got == 0) {
            break;
        }

        if (!writeAll(STDOUT_FILENO, buffer.data(), static_cast<size_t>(got))) {
            common::Logger::instance().error("[Pipe] Write failed | error={}", std::strerror(errno));
            status = 1;
            break;
        }

        uint64_t delta = bytes_
            ? static_cast<uint64_t>(got)
            : static_cast<uint64_t>(std::count(buffer.begin(), buffer.begin() + got, *delimiter));
        if (delta > 0) {
            bar.update(delta);
            items += delta;
        }
    }

    bar.finish();
    common::Logger::instance().debug("[Pipe] Finished | items={} | status={}", items, status);
    return status;
}

}}
