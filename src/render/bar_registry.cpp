#include "avance/render/bar_registry.hpp"
#include "avance/config/validator.hpp"
#include "avance/format/line_formatter.hpp"
#include "avance/common/logger.hpp"
#include <algorithm>

namespace avance {
namespace render {

std::atomic<uint64_t> BarRegistry::next_row_id_{1};

BarRegistry::BarRegistry(std::unique_ptr<terminal::TerminalSink> sink, SchedulerMode mode, size_t max_rows)
    : sink_(std::move(sink)),
      scheduler_mode_(mode),
      max_rows_(std::max(max_rows, constants::render::MIN_MAX_ROWS)) {}

std::shared_ptr<BarRegistry> BarRegistry::create(std::unique_ptr<terminal::TerminalSink> sink,
                                                 SchedulerMode mode,
                                                 size_t max_rows) {
    if (!sink) {
        sink = terminal::TerminalSink::forStderr();
    }
    return std::shared_ptr<BarRegistry>(new BarRegistry(std::move(sink), mode, max_rows));
}

std::shared_ptr<BarRegistry> BarRegistry::global() {
    // The logger must outlive the registry's destructor, which logs.
    common::Logger::instance();
    static std::shared_ptr<BarRegistry> registry =
        create(terminal::TerminalSink::forStderr(), SchedulerMode::BACKGROUND);
    return registry;
}

BarRegistry::~BarRegistry() {
    if (auto scheduler = std::atomic_exchange(&scheduler_, std::shared_ptr<RedrawScheduler>())) {
        scheduler->stop();
    }
}

std::shared_ptr<core::BarState> BarRegistry::registerBar(std::optional<uint64_t> total,
                                                         const std::string& description,
                                                         const core::StyleConfig& style) {
    config::ConfigValidator::requireValidStyle(style);

    uint64_t row_id = next_row_id_.fetch_add(1, std::memory_order_relaxed);
    auto bar = std::make_shared<core::BarState>(row_id, total, description, style,
                                                std::weak_ptr<core::BarListener>(weak_from_this()));
    size_t position = 0;
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        ensureSchedulerLocked(style);
        rows_.push_back(Row{row_id, bar});
        position = committed_rows_ + rows_.size() - 1;
    }

    common::Logger::instance().debug("[Registry] Bar registered | row_id={} | position={} | total={}",
                                     row_id, position,
                                     total ? std::to_string(*total) : std::string("none"));
    if (auto scheduler = currentScheduler()) {
        scheduler->markDirty();
    }
    return bar;
}

void BarRegistry::unregister(uint64_t row_id) {
    std::shared_ptr<core::BarState> bar;
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        auto it = findRowLocked(row_id);
        if (it == rows_.end() || it->frozen) {
            return;
        }
        bar = it->bar.lock();
        if (!bar) {
            std::string last_line;
            size_t index = static_cast<size_t>(it - rows_.begin());
            if (index < drawn_.size()) {
                last_line = drawn_[index];
            }
            if (layout_mode_ == core::LayoutMode::STABLE) {
                it->frozen = true;
                it->final_line = last_line;
            } else {
                rows_.erase(it);
            }
        }
    }

    if (bar) {
        // Routes back through onBarFinished.
        bar->finish();
        return;
    }

    common::Logger::instance().debug("[Registry] Orphaned row dropped | row_id={}", row_id);
    if (auto scheduler = currentScheduler()) {
        scheduler->markDirty();
    }
    retireSchedulerIfIdle();
}

std::optional<size_t> BarRegistry::position(uint64_t row_id) const {
    std::lock_guard<std::mutex> lock(rows_mutex_);
    auto it = findRowLocked(row_id);
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return committed_rows_ + static_cast<size_t>(it - rows_.begin());
}

std::vector<uint64_t> BarRegistry::activeRows() const {
    std::lock_guard<std::mutex> lock(rows_mutex_);
    std::vector<uint64_t> ids;
    for (const auto& row : rows_) {
        if (!row.frozen) {
            ids.push_back(row.row_id);
        }
    }
    return ids;
}

size_t BarRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(rows_mutex_);
    return static_cast<size_t>(std::count_if(rows_.begin(), rows_.end(),
                                             [](const Row& row) { return !row.frozen; }));
}

size_t BarRegistry::rowCount() const {
    std::lock_guard<std::mutex> lock(rows_mutex_);
    return rows_.size();
}

bool BarRegistry::flush() {
    if (auto scheduler = currentScheduler()) {
        return scheduler->flush();
    }
    return false;
}

void BarRegistry::shutdown() {
    std::vector<std::shared_ptr<core::BarState>> live;
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        for (const auto& row : rows_) {
            if (row.frozen) continue;
            if (auto bar = row.bar.lock()) {
                live.push_back(std::move(bar));
            }
        }
    }

    common::Logger::instance().debug("[Registry] Shutdown | active_bars={}", live.size());
    for (auto& bar : live) {
        bar->finish();
    }

    if (auto scheduler = std::atomic_exchange(&scheduler_, std::shared_ptr<RedrawScheduler>())) {
        scheduler->stop();
        std::lock_guard<std::mutex> lock(rows_mutex_);
        retired_frames_ += scheduler->framesRendered();
    }
}

uint64_t BarRegistry::framesRendered() const {
    uint64_t frames = 0;
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        frames = retired_frames_;
    }
    if (auto scheduler = currentScheduler()) {
        frames += scheduler->framesRendered();
    }
    return frames;
}

std::optional<RedrawState> BarRegistry::schedulerState() const {
    if (auto scheduler = currentScheduler()) {
        return scheduler->state();
    }
    return std::nullopt;
}

core::LayoutMode BarRegistry::layoutMode() const {
    std::lock_guard<std::mutex> lock(rows_mutex_);
    return layout_mode_;
}

void BarRegistry::setMaxRows(size_t max_rows) {
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        max_rows_ = std::max(max_rows, constants::render::MIN_MAX_ROWS);
    }
    if (auto scheduler = currentScheduler()) {
        scheduler->markDirty();
    }
}

void BarRegistry::applyDisplayConfig(const common::DisplayConfig& display) {
    size_t max_rows = display.max_rows > 0 ? static_cast<size_t>(display.max_rows)
                                           : constants::render::DEFAULT_MAX_ROWS;
    setMaxRows(max_rows);
    common::Logger::instance().debug("[Registry] Display config applied | max_rows={}", max_rows);
}

void BarRegistry::onBarUpdated(core::BarState&) {
    if (auto scheduler = currentScheduler()) {
        scheduler->markDirty();
    }
}

void BarRegistry::onBarFinished(core::BarState& bar) {
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        auto it = findRowLocked(bar.rowId());
        if (it == rows_.end() || it->frozen) {
            return;
        }

        std::string final_line = format::formatLine(bar.snapshot(), bar.elapsed(), bar.style(), sink_->width());
        if (layout_mode_ == core::LayoutMode::STABLE) {
            it->frozen = true;
            it->final_line = std::move(final_line);
        } else {
            history_.push_back(std::move(final_line));
            rows_.erase(it);
        }
    }

    common::Logger::instance().debug("[Registry] Bar finished | row_id={} | value={}",
                                     bar.rowId(), bar.current());

    // The final frame skips the throttle so the completed line always lands.
    if (auto scheduler = currentScheduler()) {
        scheduler->redrawNow();
    }
    retireSchedulerIfIdle();
}

void BarRegistry::onBarReset(core::BarState& bar) {
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        auto it = findRowLocked(bar.rowId());
        if (it != rows_.end()) {
            it->frozen = false;
            it->emitted = false;
            it->final_line.clear();
        } else {
            rows_.push_back(Row{bar.rowId(), bar.weak_from_this()});
        }
        ensureSchedulerLocked(bar.style());
    }

    common::Logger::instance().debug("[Registry] Bar reset | row_id={}", bar.rowId());
    if (auto scheduler = currentScheduler()) {
        scheduler->markDirty();
    }
}

std::shared_ptr<RedrawScheduler> BarRegistry::currentScheduler() const {
    return std::atomic_load(&scheduler_);
}

void BarRegistry::ensureSchedulerLocked(const core::StyleConfig& style) {
    if (auto existing = currentScheduler()) {
        if (existing->interval() != style.refresh_interval || layout_mode_ != style.layout_mode) {
            common::Logger::instance().debug("[Registry] Style ignored, scheduler already running | "
                                             "interval_ms={} | layout={}",
                                             existing->interval().count(), core::toString(layout_mode_));
        }
        return;
    }

    layout_mode_ = style.layout_mode;
    auto scheduler = std::make_shared<RedrawScheduler>(style.refresh_interval,
                                                       [this] { renderFrame(); },
                                                       scheduler_mode_);
    std::atomic_store(&scheduler_, scheduler);
    common::Logger::instance().debug("[Registry] Scheduler created | interval_ms={} | layout={}",
                                     style.refresh_interval.count(), core::toString(layout_mode_));
}

void BarRegistry::retireSchedulerIfIdle() {
    std::shared_ptr<RedrawScheduler> retired;
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        if (hasActiveRowsLocked()) {
            return;
        }
        retired = std::atomic_exchange(&scheduler_, std::shared_ptr<RedrawScheduler>());
    }
    if (!retired) {
        return;
    }

    retired->stop();

    std::lock_guard<std::mutex> lock(rows_mutex_);
    retired_frames_ += retired->framesRendered();
    // A bar may have registered while the old scheduler was stopping.
    if (hasActiveRowsLocked()) {
        return;
    }
    if (!rows_.empty() || !history_.empty()) {
        // The last pass failed to land; frozen rows still owe their final line.
        renderLocked();
    }
    if (rows_.empty() && history_.empty()) {
        drawn_.clear();
        committed_rows_ = 0;
    } else {
        common::Logger::instance().warn("[Registry] Final lines pending after retire | rows={}", rows_.size());
    }
    common::Logger::instance().debug("[Registry] Idle, scheduler retired | frames={}", retired_frames_);
}

void BarRegistry::renderFrame() {
    std::lock_guard<std::mutex> lock(rows_mutex_);
    renderLocked();
}

void BarRegistry::renderLocked() {
    if (sink_->ansiEnabled()) {
        renderAnsiLocked();
    } else {
        renderPlainLocked();
    }
}

void BarRegistry::renderAnsiLocked() {
    auto now = core::BarState::Clock::now();
    size_t width = sink_->width();
    size_t height = sink_->height();
    size_t limit = std::min(max_rows_, std::max(height > 0 ? height - 1 : 0, constants::render::MIN_MAX_ROWS));

    // With every row frozen the block is drawn unfolded, so rows that finished
    // while hidden still print their final line before becoming scrollback.
    bool folding = rows_.size() > limit && hasActiveRowsLocked();
    size_t visible = folding ? limit - 1 : rows_.size();
    std::vector<std::string> block;
    block.reserve(visible + 1);

    for (size_t i = 0; i < visible; ++i) {
        Row& row = rows_[i];
        if (row.frozen) {
            block.push_back(row.final_line);
        } else if (auto bar = row.bar.lock()) {
            block.push_back(format::formatLine(bar->snapshot(), bar->elapsed(now), bar->style(), width));
        } else {
            // Handle dropped without reaching onBarFinished; keep what was on screen.
            row.frozen = true;
            row.final_line = i < drawn_.size() ? drawn_[i] : std::string();
            block.push_back(row.final_line);
        }
    }
    if (rows_.size() > visible) {
        block.push_back(format::formatHiddenRows(rows_.size() - visible, width));
    }

    std::vector<std::string> lines;
    lines.reserve(history_.size() + block.size());
    lines.insert(lines.end(), history_.begin(), history_.end());
    lines.insert(lines.end(), block.begin(), block.end());

    sink_->moveCursorUp(drawn_.size());
    size_t skipped = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!full_redraw_ && i < drawn_.size() && drawn_[i] == lines[i]) {
            ++skipped;
            continue;
        }
        sink_->moveCursorDown(skipped);
        skipped = 0;
        sink_->writeLine(lines[i]);
    }
    sink_->moveCursorDown(skipped);

    if (lines.size() < drawn_.size()) {
        size_t leftover = drawn_.size() - lines.size();
        for (size_t i = 0; i < leftover; ++i) {
            sink_->clearCurrentLine();
            sink_->moveCursorDown(1);
        }
        sink_->moveCursorUp(leftover);
    }

    if (!sink_->flush()) {
        // Screen state unknown; the next pass repaints everything from the last good frame.
        full_redraw_ = true;
        return;
    }

    full_redraw_ = false;
    history_.clear();
    drawn_ = std::move(block);
    commitFrozenPrefixLocked(visible);
}

void BarRegistry::renderPlainLocked() {
    for (const auto& line : history_) {
        sink_->writeLine(line);
    }
    for (auto& row : rows_) {
        if (row.frozen && !row.emitted) {
            sink_->writeLine(row.final_line);
            row.emitted = true;
        }
    }

    if (sink_->flush()) {
        history_.clear();
    }
    commitFrozenPrefixLocked(rows_.size());
}

void BarRegistry::commitFrozenPrefixLocked(size_t max_count) {
    size_t count = 0;
    while (count < std::min(max_count, rows_.size()) && rows_[count].frozen) {
        ++count;
    }
    if (count == 0) {
        return;
    }

    rows_.erase(rows_.begin(), rows_.begin() + static_cast<std::ptrdiff_t>(count));
    drawn_.erase(drawn_.begin(), drawn_.begin() + static_cast<std::ptrdiff_t>(std::min(count, drawn_.size())));
    committed_rows_ += count;
}

std::vector<BarRegistry::Row>::iterator BarRegistry::findRowLocked(uint64_t row_id) {
    return std::find_if(rows_.begin(), rows_.end(), [row_id](const Row& row) { return row.row_id == row_id; });
}

std::vector<BarRegistry::Row>::const_iterator BarRegistry::findRowLocked(uint64_t row_id) const {
    return std::find_if(rows_.begin(), rows_.end(), [row_id](const Row& row) { return row.row_id == row_id; });
}

bool BarRegistry::hasActiveRowsLocked() const {
    return std::any_of(rows_.begin(), rows_.end(), [](const Row& row) { return !row.frozen; });
}

}

void shutdown() {
    render::BarRegistry::global()->shutdown();
}

}
