#pragma once

#include <string>
#include <vector>
#include <optional>
#include <istream>
#include <cstdint>
#include <cstddef>

namespace avance {

namespace core {
struct StyleConfig;
}

namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    std::string log_file;
    LogLevel level;
    LogFormat format;
    size_t rotation_size_mb;
    size_t max_files;
};

struct DisplayConfig {
    std::string style;
    std::string glyphs;
    int width;
    int64_t refresh_interval_ms;
    std::string unit_label;
    bool unit_scale;
    std::string layout;
    int64_t max_rows;
};

struct GlobalConfig {
    LoggingConfig logging;
    DisplayConfig display;
};

std::optional<LogLevel> parseLogLevel(const std::string& text);
std::string toString(LogLevel level);

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    bool loadFromStream(std::istream& input, const std::string& source_name);
    void reset();

    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    // Throws core::ConfigError when the display section does not describe a usable style.
    core::StyleConfig styleConfig() const;

    std::string getConfigPath() const { return current_config_path_; }

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    static GlobalConfig createDefaultConfig();
    bool tryLoadTomlFile(const std::string& path);
};

}}
