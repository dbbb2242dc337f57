#pragma once

#include "style.hpp"
#include "../format/line_formatter.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <cstdint>

namespace avance {
namespace core {

class BarState;

// Receives lifecycle notifications from bars. Implemented by the registry.
class BarListener {
public:
    virtual ~BarListener() = default;

    virtual void onBarUpdated(BarState& bar) = 0;
    virtual void onBarFinished(BarState& bar) = 0;
    virtual void onBarReset(BarState& bar) = 0;
};

// Shared state of one progress bar.
//
// Counter writes use release ordering and snapshot() reads use acquire, so a
// redraw pass that starts after update() returns observes that update.
// finish() and reset() are serialized by lifecycle_mutex_; a reset that finds
// a finish in progress fails instead of waiting for it.
class BarState : public std::enable_shared_from_this<BarState> {
public:
    using Clock = std::chrono::steady_clock;

    BarState(uint64_t row_id,
             std::optional<uint64_t> total,
             const std::string& description,
             StyleConfig style,
             std::weak_ptr<BarListener> listener = {});

    BarState(const BarState&) = delete;
    BarState& operator=(const BarState&) = delete;

    // Adds delta, saturating at the counter's maximum. Never throws.
    void update(uint64_t delta);
    void inc() { update(1); }
    void set(uint64_t value);

    // One-way transition; the second and later calls do nothing.
    void finish();

    // Throws InvalidStateError(LIFECYCLE_RACE) when a finish() is in progress.
    void reset();

    void setDescription(const std::string& description);
    void setPostfix(const std::string& postfix);

    format::BarSnapshot snapshot() const;
    std::chrono::duration<double> elapsed(Clock::time_point now = Clock::now()) const;

    uint64_t rowId() const { return row_id_; }
    uint64_t current() const { return current_.load(std::memory_order_acquire); }
    std::optional<uint64_t> total() const { return total_; }
    bool isFinished() const { return finished_.load(std::memory_order_acquire); }
    const StyleConfig& style() const { return style_; }

private:
    static int64_t toTicks(Clock::time_point tp) { return tp.time_since_epoch().count(); }
    static Clock::time_point fromTicks(int64_t ticks) { return Clock::time_point(Clock::duration(ticks)); }

    void touch();
    void notifyUpdated();

    const uint64_t row_id_;
    const std::optional<uint64_t> total_;
    const StyleConfig style_;
    const std::weak_ptr<BarListener> listener_;

    std::atomic<uint64_t> current_{0};
    std::atomic<bool> finished_{false};
    std::atomic<int64_t> start_ticks_;
    std::atomic<int64_t> last_update_ticks_;
    std::atomic<int64_t> finish_ticks_{0};

    mutable std::mutex text_mutex_;
    std::string description_;
    std::string postfix_;

    std::mutex lifecycle_mutex_;
};

}}
