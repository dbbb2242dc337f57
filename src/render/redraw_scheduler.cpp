#include "avance/render/redraw_scheduler.hpp"
#include "avance/common/logger.hpp"

namespace avance {
namespace render {

const char* toString(RedrawState state) {
    switch (state) {
        case RedrawState::IDLE: return "IDLE";
        case RedrawState::DIRTY: return "DIRTY";
        case RedrawState::REDRAWING: return "REDRAWING";
    }
    return "UNKNOWN";
}

RedrawScheduler::RedrawScheduler(std::chrono::milliseconds min_interval,
                                 RenderCallback render,
                                 SchedulerMode mode)
    : interval_(min_interval),
      render_(std::move(render)),
      mode_(mode) {
    if (mode_ == SchedulerMode::BACKGROUND) {
        worker_ = std::thread(&RedrawScheduler::run, this);
    }
    common::Logger::instance().debug("[Scheduler] Started | interval_ms={} | mode={}",
                                     interval_.count(),
                                     mode_ == SchedulerMode::BACKGROUND ? "background" : "manual");
}

RedrawScheduler::~RedrawScheduler() {
    stop();
}

void RedrawScheduler::markDirty() {
    bool wake = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case RedrawState::DIRTY:
                return;
            case RedrawState::IDLE:
                state_ = RedrawState::DIRTY;
                wake = true;
                break;
            case RedrawState::REDRAWING:
                redirty_ = true;
                break;
        }
    }
    if (wake && mode_ == SchedulerMode::BACKGROUND) {
        cv_.notify_all();
    }
}

bool RedrawScheduler::flush() {
    return runPass(false);
}

void RedrawScheduler::redrawNow() {
    runPass(true);
}

void RedrawScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
        common::Logger::instance().debug("[Scheduler] Stopped | frames={}", framesRendered());
    }

    flush();
}

RedrawState RedrawScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void RedrawScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || state_ == RedrawState::DIRTY; });
        if (stopping_) {
            break;
        }

        auto due = last_redraw_ + interval_;
        if (Clock::now() < due) {
            // Updates arriving inside the window only keep the state DIRTY;
            // the pass after the window renders the newest of them.
            cv_.wait_until(lock, due, [this] { return stopping_; });
            if (stopping_) {
                break;
            }
            continue;
        }

        lock.unlock();
        runPass(false);
        lock.lock();
    }
}

bool RedrawScheduler::runPass(bool force) {
    std::lock_guard<std::mutex> render_lock(render_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!force && state_ != RedrawState::DIRTY) {
            return false;
        }
        state_ = RedrawState::REDRAWING;
        redirty_ = false;
    }

    try {
        render_();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Scheduler] Render pass failed | error={}", e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_redraw_ = Clock::now();
        frames_rendered_.fetch_add(1, std::memory_order_acq_rel);
        state_ = redirty_ ? RedrawState::DIRTY : RedrawState::IDLE;
        redirty_ = false;
    }
    cv_.notify_all();
    return true;
}

}}
