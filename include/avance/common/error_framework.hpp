#pragma once

#include <string>
#include <map>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>

namespace avance {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

// row_id is set when the failure concerns a single bar.
struct ErrorContext {
    std::string component;
    std::string operation;
    std::optional<uint64_t> row_id;
    std::map<std::string, std::string> details;
};

template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        static ErrorInfo<EnumType> fallback{EnumType{}, "UNKNOWN", "Unknown error"};
        return fallback;
    }

    static const char* toString(EnumType code) {
        return getInfo(code).code_str;
    }

    static const char* getMessage(EnumType code) {
        return getInfo(code).default_message;
    }

protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::vector<std::string> fields;
    if (!ctx.component.empty()) {
        fields.push_back("component=" + ctx.component);
    }
    if (!ctx.operation.empty()) {
        fields.push_back("op=" + ctx.operation);
    }
    if (ctx.row_id) {
        fields.push_back("row_id=" + std::to_string(*ctx.row_id));
    }
    for (const auto& [key, value] : ctx.details) {
        fields.push_back(key + "=" + value);
    }

    std::string result;
    for (const auto& field : fields) {
        if (!result.empty()) {
            result += " | ";
        }
        result += field;
    }
    return result;
}

}}
