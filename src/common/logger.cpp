#include "avance/common/logger.hpp"
#include "avance/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>
#include <vector>

namespace avance {
namespace common {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const LoggingConfig& logging_config) {
    if (auto existing = current()) {
        existing->warn("[Logger] Already initialized, ignoring duplicate initialization");
        return;
    }

    auto spdlog_level = toSpdlogLevel(logging_config.level);
    std::vector<spdlog::sink_ptr> sinks;

    auto add_console_sink = [&]() {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog_level);
        sinks.push_back(console_sink);
    };

    try {
        if (mode == LogMode::FILE_ONLY) {
            if (logging_config.log_file.empty()) {
                throw std::runtime_error("Log file path required for FILE_ONLY mode");
            }

            std::filesystem::path log_path(logging_config.log_file);
            std::filesystem::path log_dir = log_path.parent_path();

            std::error_code ec;
            if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec) &&
                !std::filesystem::create_directories(log_dir, ec)) {
                std::cerr << "[Logger] Failed to create log directory: " << log_dir
                          << " - " << ec.message() << std::endl;
                std::cerr << "[Logger] Falling back to console output" << std::endl;
                add_console_sink();
            } else {
                try {
                    std::string effective_log_file =
                        getLogFileWithSuffix(logging_config.format, logging_config.log_file);

                    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        effective_log_file,
                        logging_config.rotation_size_mb * 1024 * 1024,
                        logging_config.max_files);
                    file_sink->set_level(spdlog_level);
                    sinks.push_back(file_sink);
                } catch (const spdlog::spdlog_ex& ex) {
                    std::cerr << "[Logger] Failed to open log file: " << logging_config.log_file
                              << " - " << ex.what() << std::endl;
                    std::cerr << "[Logger] Falling back to console output" << std::endl;
                    add_console_sink();
                }
            }
        } else {
            add_console_sink();
        }

        auto logger = std::make_shared<spdlog::logger>(
            constants::system::LOGGER_NAME, sinks.begin(), sinks.end());

        if (logging_config.format == LogFormat::JSON) {
            logger->set_pattern(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"message":"%v"})");
        } else {
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        }

        logger->set_level(spdlog_level);

        if (mode == LogMode::FILE_ONLY) {
            logger->flush_on(spdlog::level::warn);
        }

        spdlog::register_logger(logger);
        std::atomic_store(&logger_, logger);

    } catch (const std::exception& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, console_sink);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->set_level(spdlog_level);
        spdlog::drop(constants::system::LOGGER_NAME);
        spdlog::register_logger(logger);
        std::atomic_store(&logger_, logger);
    }
}

void Logger::setLevel(LogLevel level) {
    if (auto logger = current()) {
        logger->set_level(toSpdlogLevel(level));
    }
}

void Logger::shutdown() {
    auto logger = std::atomic_exchange(&logger_, std::shared_ptr<spdlog::logger>());
    if (logger) {
        logger->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
    }
}

void Logger::flush() {
    if (auto logger = current()) {
        logger->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) const {
    if (format == LogFormat::JSON) {
        std::filesystem::path p(base_path);
        std::string stem = p.stem().string();
        std::string ext = p.extension().string();
        std::string parent = p.parent_path().string();

        if (parent.empty()) {
            return stem + ".json" + ext;
        }
        return parent + "/" + stem + ".json" + ext;
    }
    return base_path;
}

}}
