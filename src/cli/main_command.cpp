#include "main_command.hpp"
#include "avance/common/config.hpp"
#include "avance/common/logger.hpp"
#include "avance/core/error_codes.hpp"
#include "avance/config/validator.hpp"

namespace avance {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

void MainCommand::addStyleOptions(CLI::App* subcommand) {
    subcommand->add_option("--style", style_name_, "Bar style: ascii, block, balloon");
    subcommand->add_option("--layout", layout_name_, "Finished bars: stable or compact");
}

core::StyleConfig MainCommand::resolveStyle(const std::string& style_name,
                                            const std::string& layout_name) const {
    auto style = common::Config::instance().styleConfig();

    if (!style_name.empty()) {
        auto parsed = core::parseStyle(style_name);
        if (!parsed) {
            throw core::ConfigError(core::ProgressErrorCode::CONFIG_INVALID,
                                    "unknown style '" + style_name + "'");
        }
        style.withGlyphs(core::styleGlyphs(*parsed));
    }

    if (!layout_name.empty()) {
        auto parsed = core::parseLayoutMode(layout_name);
        if (!parsed) {
            throw core::ConfigError(core::ProgressErrorCode::CONFIG_INVALID,
                                    "unknown layout '" + layout_name + "'");
        }
        style.withLayout(*parsed);
    }

    config::ConfigValidator::requireValidStyle(style);
    common::Logger::instance().debug("[CLI] Style resolved | layout={} | interval_ms={}",
                                     core::toString(style.layout_mode), style.refresh_interval.count());
    return style;
}

}}
