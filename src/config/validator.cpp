#include "avance/config/validator.hpp"
#include "avance/format/format_utils.hpp"
#include "avance/common/logger.hpp"
#include <filesystem>
#include <algorithm>

namespace avance {
namespace config {

namespace {

void fail(ValidationResult& result, core::ProgressErrorCode code, std::string message) {
    result.errors.push_back(std::move(message));
    result.is_valid = false;
    if (!result.first_error) {
        result.first_error = code;
    }
}

}

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;

    common::Logger::instance().debug("[Validator] Starting validation");

    const auto& display = config.display;

    if (!core::parseStyle(display.style)) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID,
             "display.style: Unknown style '" + display.style + "' (expected: ascii, block, balloon)");
    }

    if (!display.glyphs.empty() && format::splitCodePoints(display.glyphs).size() < 2) {
        fail(result, core::ProgressErrorCode::CONFIG_EMPTY_GLYPHS,
             "display.glyphs: Needs at least an empty and a full glyph");
    }

    if (!validateDisplayText(display.glyphs)) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID_TEXT,
             "display.glyphs: Contains control characters");
    }

    if (display.width < 0 || display.width > 0xFFFF) {
        fail(result, core::ProgressErrorCode::CONFIG_ZERO_WIDTH,
             "display.width: Must be between 0-65535 (0=terminal width)");
    }

    if (display.refresh_interval_ms < 0) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID_INTERVAL,
             "display.refresh_interval_ms: Must be >= 0");
    } else if (display.refresh_interval_ms == 0) {
        result.warnings.push_back("display.refresh_interval_ms: 0 redraws on every update");
    }

    if (display.unit_label.empty() || !validateDisplayText(display.unit_label)) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID_TEXT,
             "display.unit_label: Must be non-empty printable text");
    }

    if (!core::parseLayoutMode(display.layout)) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID,
             "display.layout: Unknown layout '" + display.layout + "' (expected: stable, compact)");
    }

    if (display.max_rows < static_cast<int64_t>(constants::render::MIN_MAX_ROWS)) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID,
             "display.max_rows: Must be >= " + std::to_string(constants::render::MIN_MAX_ROWS));
    }

    if (!config.logging.log_file.empty()) {
        auto parent = std::filesystem::path(config.logging.log_file).parent_path();
        if (!parent.empty() && !canCreateDirectory(parent.string())) {
            fail(result, core::ProgressErrorCode::CONFIG_INVALID,
                 "logging.file: Cannot create parent directory");
        }
    }

    if (config.logging.rotation_size_mb < 1) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID, "logging.rotation_size_mb: Must be >= 1");
    }

    if (config.logging.max_files < 1) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID, "logging.max_files: Must be >= 1");
    }

    if (result.is_valid) {
        common::Logger::instance().debug("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().warn("[Validator] Failed | errors={}", result.errors.size());
    }

    return result;
}

ValidationResult ConfigValidator::validateStyle(const core::StyleConfig& style) {
    ValidationResult result;

    if (style.width && *style.width == 0) {
        fail(result, core::ProgressErrorCode::CONFIG_ZERO_WIDTH, "width: Must be greater than zero");
    }

    if (style.bar_glyphs.empty()) {
        fail(result, core::ProgressErrorCode::CONFIG_EMPTY_GLYPHS, "bar_glyphs: Must not be empty");
    } else if (!validateDisplayText(style.bar_glyphs)) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID_TEXT, "bar_glyphs: Contains control characters");
    }

    if (style.refresh_interval.count() < 0) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID_INTERVAL,
             "refresh_interval: Must not be negative");
    }

    if (!validateDisplayText(style.unit_label)) {
        fail(result, core::ProgressErrorCode::CONFIG_INVALID_TEXT, "unit_label: Contains control characters");
    }

    return result;
}

void ConfigValidator::requireValidStyle(const core::StyleConfig& style) {
    auto result = validateStyle(style);
    if (result.is_valid) {
        return;
    }

    common::ErrorContext ctx;
    ctx.component = "Validator";
    ctx.details["errors"] = std::to_string(result.errors.size());
    std::string detail;
    for (const auto& error : result.errors) {
        if (!detail.empty()) detail += "; ";
        detail += error;
    }
    common::Logger::instance().debug("[Validator] Style rejected | {}", detail);
    throw core::ConfigError(result.first_error.value_or(core::ProgressErrorCode::CONFIG_INVALID),
                            detail, ctx);
}

bool ConfigValidator::validateDisplayText(const std::string& text) {
    return std::none_of(text.begin(), text.end(), [](char c) {
        return format::isControlCharacter(static_cast<unsigned char>(c));
    });
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    try {
        std::filesystem::path p(path);
        if (std::filesystem::exists(p)) {
            return std::filesystem::is_directory(p);
        }

        auto parent = p.parent_path();
        while (!parent.empty() && !std::filesystem::exists(parent)) {
            parent = parent.parent_path();
        }
        return parent.empty() || std::filesystem::is_directory(parent);
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

}}
