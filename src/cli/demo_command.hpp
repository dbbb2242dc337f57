#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <cstdint>

namespace avance {
namespace cli {

// Drives several bars from a pool of workers, plus one overall bar they all share.
class DemoCommand : public MainCommand {
public:
    DemoCommand();

    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    int bars_ = 3;
    int workers_ = 4;
    uint64_t total_ = 1000;
    int delay_ms_ = 3;
    int max_rows_ = 0;
};

}}
