#pragma once

#include "redraw_scheduler.hpp"
#include "../core/bar_state.hpp"
#include "../core/style.hpp"
#include "../terminal/terminal_sink.hpp"
#include "../common/constants.hpp"
#include "../common/config.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace avance {
namespace render {

// Ordered set of bars sharing one terminal block.
//
// The block is redrawn in place: the cursor rests on the line below it, each
// pass moves up to the block's top and rewrites only lines that changed.
// Finished bars either stay frozen in their row (STABLE) or leave the block,
// their final line printed above it while the rows below move up (COMPACT).
// Frozen rows at the top of the block become plain scrollback.
//
// rows_mutex_ covers the row list and the on-screen bookkeeping, and is held
// for a whole redraw pass, so a pass never sees a half-registered row.
class BarRegistry : public core::BarListener,
                    public std::enable_shared_from_this<BarRegistry> {
public:
    static std::shared_ptr<BarRegistry> create(std::unique_ptr<terminal::TerminalSink> sink,
                                               SchedulerMode mode = SchedulerMode::BACKGROUND,
                                               size_t max_rows = constants::render::DEFAULT_MAX_ROWS);

    // Process-wide registry drawing on stderr, created on first use.
    static std::shared_ptr<BarRegistry> global();

    ~BarRegistry() override;

    BarRegistry(const BarRegistry&) = delete;
    BarRegistry& operator=(const BarRegistry&) = delete;

    // Throws core::ConfigError for an invalid style.
    std::shared_ptr<core::BarState> registerBar(std::optional<uint64_t> total,
                                                const std::string& description,
                                                const core::StyleConfig& style);

    // Finishes the bar behind row_id, or drops the row if that bar is gone.
    void unregister(uint64_t row_id);

    // Row index from the top of the block. Under STABLE layout it never
    // changes while the bar is active.
    std::optional<size_t> position(uint64_t row_id) const;

    std::vector<uint64_t> activeRows() const;
    size_t activeCount() const;
    size_t rowCount() const;

    bool flush();

    // Finishes every active bar, renders, and stops the scheduler thread.
    void shutdown();

    uint64_t framesRendered() const;
    std::optional<RedrawState> schedulerState() const;
    core::LayoutMode layoutMode() const;
    void setMaxRows(size_t max_rows);

    // Applies the registry-level settings of a validated [display] section.
    void applyDisplayConfig(const common::DisplayConfig& display);

    void onBarUpdated(core::BarState& bar) override;
    void onBarFinished(core::BarState& bar) override;
    void onBarReset(core::BarState& bar) override;

private:
    struct Row {
        uint64_t row_id;
        std::weak_ptr<core::BarState> bar;
        bool frozen = false;
        bool emitted = false;
        std::string final_line;
    };

    BarRegistry(std::unique_ptr<terminal::TerminalSink> sink, SchedulerMode mode, size_t max_rows);

    std::shared_ptr<RedrawScheduler> currentScheduler() const;
    void ensureSchedulerLocked(const core::StyleConfig& style);
    void retireSchedulerIfIdle();

    void renderFrame();
    void renderLocked();
    void renderAnsiLocked();
    void renderPlainLocked();
    void commitFrozenPrefixLocked(size_t max_count);

    std::vector<Row>::iterator findRowLocked(uint64_t row_id);
    std::vector<Row>::const_iterator findRowLocked(uint64_t row_id) const;
    bool hasActiveRowsLocked() const;

    std::unique_ptr<terminal::TerminalSink> sink_;
    const SchedulerMode scheduler_mode_;

    mutable std::mutex rows_mutex_;
    std::vector<Row> rows_;
    std::vector<std::string> history_;
    std::vector<std::string> drawn_;
    bool full_redraw_ = false;
    size_t committed_rows_ = 0;
    size_t max_rows_;
    core::LayoutMode layout_mode_ = core::LayoutMode::STABLE;
    uint64_t retired_frames_ = 0;

    // Swapped with std::atomic_load/atomic_store: producers signal it without rows_mutex_.
    std::shared_ptr<RedrawScheduler> scheduler_;

    static std::atomic<uint64_t> next_row_id_;
};

}

// Deterministic teardown of the process-wide registry.
void shutdown();

}
