#include "avance/common/config.hpp"
#include "avance/common/constants.hpp"
#include "avance/common/logger.hpp"
#include "avance/config/validator.hpp"
#include "avance/core/style.hpp"
#include "avance/core/error_codes.hpp"
#include <toml.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace avance {
namespace common {

namespace {

void applyToml(const toml::value& data, GlobalConfig& global) {
    if (data.contains("logging")) {
        const auto& logging_section = data.at("logging");

        if (logging_section.contains("file")) {
            global.logging.log_file = toml::find<std::string>(logging_section, "file");
        }
        if (logging_section.contains("level")) {
            std::string level = toml::find<std::string>(logging_section, "level");
            if (auto parsed = parseLogLevel(level)) {
                global.logging.level = *parsed;
            } else {
                Logger::instance().warn("[Config] Unknown log level ignored | level={}", level);
            }
        }
        if (logging_section.contains("format")) {
            std::string format_str = toml::find<std::string>(logging_section, "format");
            global.logging.format = format_str == "json" ? LogFormat::JSON : LogFormat::TEXT;
        }
        if (logging_section.contains("rotation_size_mb")) {
            global.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
        }
        if (logging_section.contains("max_files")) {
            global.logging.max_files = toml::find<size_t>(logging_section, "max_files");
        }
    }

    if (data.contains("display")) {
        const auto& display_section = data.at("display");

        if (display_section.contains("style")) {
            global.display.style = toml::find<std::string>(display_section, "style");
        }
        if (display_section.contains("glyphs")) {
            global.display.glyphs = toml::find<std::string>(display_section, "glyphs");
        }
        if (display_section.contains("width")) {
            global.display.width = toml::find<int>(display_section, "width");
        }
        if (display_section.contains("refresh_interval_ms")) {
            global.display.refresh_interval_ms = toml::find<int64_t>(display_section, "refresh_interval_ms");
        }
        if (display_section.contains("unit_label")) {
            global.display.unit_label = toml::find<std::string>(display_section, "unit_label");
        }
        if (display_section.contains("unit_scale")) {
            global.display.unit_scale = toml::find<bool>(display_section, "unit_scale");
        }
        if (display_section.contains("layout")) {
            global.display.layout = toml::find<std::string>(display_section, "layout");
        }
        if (display_section.contains("max_rows")) {
            global.display.max_rows = toml::find<int64_t>(display_section, "max_rows");
        }
    }
}

}

std::optional<LogLevel> parseLogLevel(const std::string& text) {
    std::string level = text;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "INFO") return LogLevel::INFO;
    if (level == "WARN" || level == "WARNING") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "WARN";
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.logging.log_file = "";
    config.logging.level = parseLogLevel(LOG_LEVEL).value_or(LogLevel::WARN);
    config.logging.format = LogFormat::TEXT;
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;

    config.display.style = DISPLAY_STYLE;
    config.display.glyphs = "";
    config.display.width = 0;
    config.display.refresh_interval_ms = REFRESH_INTERVAL_MS;
    config.display.unit_label = constants::render::DEFAULT_UNIT;
    config.display.unit_scale = false;
    config.display.layout = DISPLAY_LAYOUT;
    config.display.max_rows = static_cast<int64_t>(MAX_ROWS);

    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv(constants::system::CONFIG_ENV); env && *env) {
        paths.emplace_back(env);
    }

    const std::string relative = std::string(constants::system::APPLICATION_NAME) + "/" +
                                 constants::system::CONFIG_FILE_NAME;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        paths.push_back(std::string(xdg) + "/" + relative);
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        paths.push_back(std::string(home) + "/.config/" + relative);
    }

    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    current_config_path_.clear();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    if (!tryLoadTomlFile(effective_config_file)) {
        return false;
    }

    current_config_path_ = effective_config_file;
    Logger::instance().info("[Config] Loaded | path={} | style={} | layout={}",
                            current_config_path_, global_.display.style, global_.display.layout);
    return true;
}

bool Config::loadFromStream(std::istream& input, const std::string& source_name) {
    try {
        auto data = toml::parse(input, source_name);
        GlobalConfig loaded = global_;
        applyToml(data, loaded);
        global_ = std::move(loaded);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | source={} | error={}", source_name, e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().error("[Config] File not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().error("[Config] File not readable | path={}", path);
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Logger::instance().error("[Config] Open failed | path={}", path);
        return false;
    }
    return loadFromStream(file, path);
}

core::StyleConfig Config::styleConfig() const {
    const auto& display = global_.display;

    auto style = core::parseStyle(display.style);
    if (!style) {
        throw core::ConfigError(core::ProgressErrorCode::CONFIG_INVALID,
                                "unknown style '" + display.style + "'");
    }
    auto layout = core::parseLayoutMode(display.layout);
    if (!layout) {
        throw core::ConfigError(core::ProgressErrorCode::CONFIG_INVALID,
                                "unknown layout '" + display.layout + "'");
    }
    if (display.width < 0 || display.width > 0xFFFF) {
        throw core::ConfigError(core::ProgressErrorCode::CONFIG_ZERO_WIDTH,
                                "width " + std::to_string(display.width) + " out of range");
    }

    auto style_config = core::StyleConfig::fromStyle(*style);
    if (!display.glyphs.empty()) {
        style_config.withGlyphs(display.glyphs);
    }
    if (display.width > 0) {
        style_config.withWidth(static_cast<uint16_t>(display.width));
    }
    style_config.withRefreshInterval(std::chrono::milliseconds(display.refresh_interval_ms))
          .withUnit(display.unit_label)
          .withUnitScale(display.unit_scale)
          .withLayout(*layout);

    config::ConfigValidator::requireValidStyle(style_config);
    return style_config;
}

}}
