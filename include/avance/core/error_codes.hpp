#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace avance {
namespace core {

enum class ProgressErrorCode {
    INVALID_STATE = 100,
    HANDLE_DETACHED = 101,
    LIFECYCLE_RACE = 102,

    SINK_WRITE_FAILED = 200,
    SINK_CLOSED = 201,

    CONFIG_INVALID = 300,
    CONFIG_ZERO_WIDTH = 301,
    CONFIG_EMPTY_GLYPHS = 302,
    CONFIG_INVALID_INTERVAL = 303,
    CONFIG_INVALID_TEXT = 304,
    CONFIG_FILE_INVALID = 305
};

using ProgressErrorCodeHelper = common::ErrorRegistry<ProgressErrorCode>;

class Error : public std::runtime_error {
public:
    Error(ProgressErrorCode code, const std::string& detail, common::ErrorContext context = {});

    ProgressErrorCode code() const { return code_; }
    const common::ErrorContext& context() const { return context_; }

private:
    ProgressErrorCode code_;
    common::ErrorContext context_;
};

// A lifecycle precondition was violated: finish/reset race, or a detached handle.
class InvalidStateError : public Error {
public:
    using Error::Error;
};

// The output stream failed. Never leaves the sink.
class SinkWriteError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

}
}

namespace avance {
namespace common {

template<>
inline const std::unordered_map<core::ProgressErrorCode, ErrorInfo<core::ProgressErrorCode>>&
ErrorRegistry<core::ProgressErrorCode>::getInfoMap() {
    static const std::unordered_map<core::ProgressErrorCode, ErrorInfo<core::ProgressErrorCode>> map = {
        {core::ProgressErrorCode::INVALID_STATE, {
            core::ProgressErrorCode::INVALID_STATE,
            "INVALID_STATE",
            "Operation not allowed in the current bar state"
        }},
        {core::ProgressErrorCode::HANDLE_DETACHED, {
            core::ProgressErrorCode::HANDLE_DETACHED,
            "HANDLE_DETACHED",
            "Progress bar handle no longer refers to a bar"
        }},
        {core::ProgressErrorCode::LIFECYCLE_RACE, {
            core::ProgressErrorCode::LIFECYCLE_RACE,
            "LIFECYCLE_RACE",
            "Reset raced with a concurrent finish"
        }},
        {core::ProgressErrorCode::SINK_WRITE_FAILED, {
            core::ProgressErrorCode::SINK_WRITE_FAILED,
            "SINK_WRITE_FAILED",
            "Terminal write failed"
        }},
        {core::ProgressErrorCode::SINK_CLOSED, {
            core::ProgressErrorCode::SINK_CLOSED,
            "SINK_CLOSED",
            "Terminal stream is closed"
        }},
        {core::ProgressErrorCode::CONFIG_INVALID, {
            core::ProgressErrorCode::CONFIG_INVALID,
            "CONFIG_INVALID",
            "Invalid style configuration"
        }},
        {core::ProgressErrorCode::CONFIG_ZERO_WIDTH, {
            core::ProgressErrorCode::CONFIG_ZERO_WIDTH,
            "CONFIG_ZERO_WIDTH",
            "Display width must be greater than zero"
        }},
        {core::ProgressErrorCode::CONFIG_EMPTY_GLYPHS, {
            core::ProgressErrorCode::CONFIG_EMPTY_GLYPHS,
            "CONFIG_EMPTY_GLYPHS",
            "Bar glyph set is empty"
        }},
        {core::ProgressErrorCode::CONFIG_INVALID_INTERVAL, {
            core::ProgressErrorCode::CONFIG_INVALID_INTERVAL,
            "CONFIG_INVALID_INTERVAL",
            "Refresh interval must not be negative"
        }},
        {core::ProgressErrorCode::CONFIG_INVALID_TEXT, {
            core::ProgressErrorCode::CONFIG_INVALID_TEXT,
            "CONFIG_INVALID_TEXT",
            "Display text contains control characters"
        }},
        {core::ProgressErrorCode::CONFIG_FILE_INVALID, {
            core::ProgressErrorCode::CONFIG_FILE_INVALID,
            "CONFIG_FILE_INVALID",
            "Configuration file could not be parsed"
        }}
    };
    return map;
}

}
}
