#include "avance/core/bar_state.hpp"
#include "avance/core/error_codes.hpp"
#include "avance/common/logger.hpp"
#include "avance/format/format_utils.hpp"
#include <limits>

namespace avance {
namespace core {

BarState::BarState(uint64_t row_id,
                   std::optional<uint64_t> total,
                   const std::string& description,
                   StyleConfig style,
                   std::weak_ptr<BarListener> listener)
    : row_id_(row_id),
      total_(total),
      style_(std::move(style)),
      listener_(std::move(listener)),
      start_ticks_(toTicks(Clock::now())),
      last_update_ticks_(start_ticks_.load()),
      description_(format::sanitizeControlCharacters(description)) {}

void BarState::update(uint64_t delta) {
    constexpr uint64_t max_value = std::numeric_limits<uint64_t>::max();

    uint64_t observed = current_.load(std::memory_order_relaxed);
    uint64_t next;
    do {
        next = delta > max_value - observed ? max_value : observed + delta;
    } while (!current_.compare_exchange_weak(observed, next,
                                             std::memory_order_release,
                                             std::memory_order_relaxed));

    touch();
    notifyUpdated();
}

void BarState::set(uint64_t value) {
    current_.store(value, std::memory_order_release);
    touch();
    notifyUpdated();
}

void BarState::finish() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (finished_.load(std::memory_order_acquire)) {
        return;
    }

    finish_ticks_.store(toTicks(Clock::now()), std::memory_order_release);
    finished_.store(true, std::memory_order_release);

    common::Logger::instance().debug("[Bar] Finished | row_id={} | current={}",
                                     row_id_, current_.load(std::memory_order_acquire));

    // The final frame is drawn while the lifecycle lock is held, so a racing
    // reset() cannot revive the bar before its completed state is on screen.
    if (auto listener = listener_.lock()) {
        listener->onBarFinished(*this);
    }
}

void BarState::reset() {
    std::unique_lock<std::mutex> lock(lifecycle_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        common::ErrorContext ctx;
        ctx.component = "Bar";
        ctx.operation = "reset";
        ctx.row_id = row_id_;
        common::Logger::instance().warn("[Bar] Reset rejected | {}", common::formatContext(ctx));
        throw InvalidStateError(ProgressErrorCode::LIFECYCLE_RACE,
                                "finish() is in progress on this bar", ctx);
    }

    auto now = toTicks(Clock::now());
    current_.store(0, std::memory_order_release);
    start_ticks_.store(now, std::memory_order_release);
    last_update_ticks_.store(now, std::memory_order_release);
    finish_ticks_.store(0, std::memory_order_release);

    bool was_finished = finished_.exchange(false, std::memory_order_acq_rel);

    common::Logger::instance().debug("[Bar] Reset | row_id={} | was_finished={}", row_id_, was_finished);

    if (auto listener = listener_.lock()) {
        listener->onBarReset(*this);
    }
}

void BarState::setDescription(const std::string& description) {
    {
        std::lock_guard<std::mutex> lock(text_mutex_);
        description_ = format::sanitizeControlCharacters(description);
    }
    notifyUpdated();
}

void BarState::setPostfix(const std::string& postfix) {
    {
        std::lock_guard<std::mutex> lock(text_mutex_);
        postfix_ = format::sanitizeControlCharacters(postfix);
    }
    notifyUpdated();
}

format::BarSnapshot BarState::snapshot() const {
    format::BarSnapshot snap;
    snap.row_id = row_id_;
    snap.total = total_;
    snap.finished = finished_.load(std::memory_order_acquire);
    snap.current = current_.load(std::memory_order_acquire);
    snap.start_time = fromTicks(start_ticks_.load(std::memory_order_acquire));
    snap.last_update_time = fromTicks(last_update_ticks_.load(std::memory_order_acquire));
    {
        std::lock_guard<std::mutex> lock(text_mutex_);
        snap.description = description_;
        snap.postfix = postfix_;
    }
    return snap;
}

std::chrono::duration<double> BarState::elapsed(Clock::time_point now) const {
    auto start = fromTicks(start_ticks_.load(std::memory_order_acquire));
    if (finished_.load(std::memory_order_acquire)) {
        auto finish_ticks = finish_ticks_.load(std::memory_order_acquire);
        if (finish_ticks != 0) {
            now = fromTicks(finish_ticks);
        }
    }
    if (now < start) {
        return std::chrono::duration<double>(0.0);
    }
    return now - start;
}

void BarState::touch() {
    last_update_ticks_.store(toTicks(Clock::now()), std::memory_order_release);
}

void BarState::notifyUpdated() {
    if (finished_.load(std::memory_order_acquire)) {
        return;
    }
    if (auto listener = listener_.lock()) {
        listener->onBarUpdated(*this);
    }
}

}}
