#include "avance/core/progress_bar.hpp"
#include "avance/core/error_codes.hpp"
#include "avance/render/bar_registry.hpp"
#include "avance/common/logger.hpp"

namespace avance {
namespace core {

namespace detail {

BarOwner::~BarOwner() {
    if (state) {
        state->finish();
    }
}

}

ProgressBar::ProgressBar(std::optional<uint64_t> total,
                         const std::string& description,
                         const StyleConfig& style,
                         std::shared_ptr<render::BarRegistry> registry) {
    if (!registry) {
        registry = render::BarRegistry::global();
    }
    auto owner = std::make_shared<detail::BarOwner>();
    owner->state = registry->registerBar(total, description, style);
    owner->registry = std::move(registry);
    owner_ = std::move(owner);
}

ProgressBar ProgressBar::likeOf(const ProgressBar& other,
                                std::optional<uint64_t> total,
                                const std::string& description) {
    const auto& source = other.attached("likeOf");
    return ProgressBar(total, description, source.state->style(), source.registry);
}

void ProgressBar::update(uint64_t delta) {
    if (!owner_) {
        common::Logger::instance().debug("[Bar] Update on detached handle ignored | delta={}", delta);
        return;
    }
    owner_->state->update(delta);
}

void ProgressBar::set(uint64_t value) {
    if (!owner_) {
        common::Logger::instance().debug("[Bar] Set on detached handle ignored | value={}", value);
        return;
    }
    owner_->state->set(value);
}

void ProgressBar::finish() {
    attached("finish").state->finish();
}

void ProgressBar::reset() {
    attached("reset").state->reset();
}

void ProgressBar::setDescription(const std::string& description) {
    if (owner_) {
        owner_->state->setDescription(description);
    }
}

void ProgressBar::setPostfix(const std::string& postfix) {
    if (owner_) {
        owner_->state->setPostfix(postfix);
    }
}

format::BarSnapshot ProgressBar::snapshot() const {
    return attached("snapshot").state->snapshot();
}

uint64_t ProgressBar::rowId() const {
    return attached("rowId").state->rowId();
}

bool ProgressBar::isFinished() const {
    return attached("isFinished").state->isFinished();
}

const StyleConfig& ProgressBar::style() const {
    return attached("style").state->style();
}

std::optional<size_t> ProgressBar::position() const {
    const auto& owner = attached("position");
    return owner.registry->position(owner.state->rowId());
}

const detail::BarOwner& ProgressBar::attached(const char* operation) const {
    if (!owner_) {
        common::ErrorContext ctx;
        ctx.component = "Bar";
        ctx.operation = operation;
        throw InvalidStateError(ProgressErrorCode::HANDLE_DETACHED,
                                std::string(operation) + "() called on a moved-from handle", ctx);
    }
    return *owner_;
}

}}
