#include "avance/core/error_codes.hpp"
#include <spdlog/fmt/fmt.h>

namespace avance {
namespace core {

namespace {

std::string composeMessage(ProgressErrorCode code, const std::string& detail,
                           const common::ErrorContext& context) {
    std::string message = ProgressErrorCodeHelper::getMessage(code);
    if (!detail.empty()) {
        message = fmt::format("{}: {}", message, detail);
    }
    std::string ctx = common::formatContext(context);
    if (!ctx.empty()) {
        message = fmt::format("{} ({})", message, ctx);
    }
    return fmt::format("[{}] {}", ProgressErrorCodeHelper::toString(code), message);
}

}

Error::Error(ProgressErrorCode code, const std::string& detail, common::ErrorContext context)
    : std::runtime_error(composeMessage(code, detail, context)),
      code_(code),
      context_(std::move(context)) {}

}}
