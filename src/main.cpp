#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "avance/common/config.hpp"
#include "avance/common/constants.hpp"
#include "avance/common/logger.hpp"
#include "avance/config/validator.hpp"
#include "avance/render/bar_registry.hpp"
#include "cli/pipe_command.hpp"
#include "cli/demo_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Progress bars for pipelines and concurrent jobs", avance::constants::system::CLI_NAME};
        app.set_version_flag("--version,-v", avance::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        std::string log_level;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "Override the configured log level (ERROR, WARN, INFO, DEBUG)");

        auto pipe_cmd = std::make_unique<avance::cli::PipeCommand>();
        auto demo_cmd = std::make_unique<avance::cli::DemoCommand>();

        pipe_cmd->setup(app.add_subcommand("pipe", "Copy stdin to stdout with a bar on stderr"));
        demo_cmd->setup(app.add_subcommand("demo", "Run concurrent bars from a worker pool"));

        CLI11_PARSE(app, argc, argv);

        auto& config = avance::common::Config::instance();
        if (!config.load(config_file)) {
            if (!config_file.empty()) {
                std::cerr << "Error: cannot load configuration from " << config_file << "\n";
                return 1;
            }
            std::cerr << "Warning: configuration file unusable, using defaults\n";
            config.reset();
        }

        auto& global = config.global();
        if (!log_level.empty()) {
            auto parsed = avance::common::parseLogLevel(log_level);
            if (!parsed) {
                std::cerr << "Error: unknown log level '" << log_level << "'\n";
                return 1;
            }
            global.logging.level = *parsed;
        }

        avance::common::Logger::instance().initialize(
            global.logging.log_file.empty() ? avance::common::LogMode::CONSOLE_ONLY
                                            : avance::common::LogMode::FILE_ONLY,
            global.logging);

        avance::config::ConfigValidator validator;
        auto validation = validator.validate(global);
        for (const auto& warning : validation.warnings) {
            avance::common::Logger::instance().warn("[Config] {}", warning);
        }
        if (!validation.is_valid) {
            for (const auto& error : validation.errors) {
                std::cerr << "Config error: " << error << "\n";
            }
            return 1;
        }

        avance::render::BarRegistry::global()->applyDisplayConfig(global.display);

        int status = 0;
        if (pipe_cmd->wasCalled()) {
            status = pipe_cmd->execute();
        } else if (demo_cmd->wasCalled()) {
            status = demo_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
            return 0;
        }

        avance::shutdown();
        avance::common::Logger::instance().shutdown();
        return status;

    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
