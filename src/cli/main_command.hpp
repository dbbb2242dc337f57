#pragma once

#include <CLI/CLI.hpp>
#include "avance/core/style.hpp"
#include <string>

namespace avance {
namespace cli {

// Shared plumbing for avc commands: the CLI11 subcommand they were set up on
// and the style resolution every command goes through.
class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual void setup(CLI::App* subcommand) = 0;
    virtual int execute() = 0;

    bool wasCalled() const { return was_called_; }

protected:
    // Config file style with any --style/--layout overrides applied.
    // Throws core::ConfigError.
    core::StyleConfig resolveStyle(const std::string& style_name,
                                   const std::string& layout_name) const;

    void addStyleOptions(CLI::App* subcommand);

    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;
    std::string style_name_;
    std::string layout_name_;
};

}}
