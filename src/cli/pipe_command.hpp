#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <optional>
#include <cstdint>

namespace avance {
namespace cli {

// Copies stdin to stdout unchanged while a bar on stderr counts delimited
// items (or bytes).
class PipeCommand : public MainCommand {
public:
    PipeCommand();

    void setup(CLI::App* subcommand) override;
    int execute() override;

    // "\n", "\t", "\0" and "\\" escapes, or a single literal byte.
    static std::optional<char> parseDelimiter(const std::string& text);

private:
    std::optional<uint64_t> total_;
    std::string delim_ = "\\n";
    std::string description_;
    bool bytes_ = false;
};

}}
