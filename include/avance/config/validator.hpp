#pragma once

#include "../common/config.hpp"
#include "../core/style.hpp"
#include "../core/error_codes.hpp"
#include <string>
#include <vector>
#include <optional>

namespace avance {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    // First failing check, used as the ConfigError code.
    std::optional<core::ProgressErrorCode> first_error;
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);

    static ValidationResult validateStyle(const core::StyleConfig& style);

    // Throws core::ConfigError carrying the first failing check.
    static void requireValidStyle(const core::StyleConfig& style);

    static bool validateDisplayText(const std::string& text);
    static bool canCreateDirectory(const std::string& path);
};

}}
