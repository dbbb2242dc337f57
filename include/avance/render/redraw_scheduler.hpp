#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <cstdint>

namespace avance {
namespace render {

enum class RedrawState {
    IDLE,
    DIRTY,
    REDRAWING
};

enum class SchedulerMode {
    BACKGROUND,
    MANUAL
};

const char* toString(RedrawState state);

// Coalesces dirty signals into rate-limited redraw passes.
//
//   IDLE/REDRAWING --markDirty--> DIRTY
//   DIRTY --timer or flush--> REDRAWING --> IDLE, or DIRTY if marked during the pass
//
// A pass renders whatever state exists when it starts, so every burst ends in
// a frame showing its last update. At most one pass runs at a time; markDirty()
// only touches a short-held state mutex and never waits for a pass.
class RedrawScheduler {
public:
    using RenderCallback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    RedrawScheduler(std::chrono::milliseconds min_interval,
                    RenderCallback render,
                    SchedulerMode mode = SchedulerMode::BACKGROUND);
    ~RedrawScheduler();

    RedrawScheduler(const RedrawScheduler&) = delete;
    RedrawScheduler& operator=(const RedrawScheduler&) = delete;

    void markDirty();

    // Runs a pending pass now on the calling thread, ignoring the throttle.
    // Returns false when nothing was dirty.
    bool flush();

    // Unconditional pass that ignores the throttle.
    void redrawNow();

    // Renders anything pending and joins the background thread. Idempotent.
    void stop();

    RedrawState state() const;
    uint64_t framesRendered() const { return frames_rendered_.load(std::memory_order_acquire); }
    std::chrono::milliseconds interval() const { return interval_; }
    SchedulerMode mode() const { return mode_; }

private:
    void run();
    bool runPass(bool force);

    const std::chrono::milliseconds interval_;
    const RenderCallback render_;
    const SchedulerMode mode_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    RedrawState state_ = RedrawState::IDLE;
    bool redirty_ = false;
    bool stopping_ = false;
    Clock::time_point last_redraw_{};

    std::mutex render_mutex_;
    std::atomic<uint64_t> frames_rendered_{0};
    std::thread worker_;
};

}}
