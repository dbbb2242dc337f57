#include "demo_command.hpp"
#include "avance/core/progress_bar.hpp"
#include "avance/core/error_codes.hpp"
#include "avance/render/bar_registry.hpp"
#include "avance/common/logger.hpp"
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <fmt/format.h>
#include <chrono>
#include <iostream>
#include <thread>

namespace avance {
namespace cli {

DemoCommand::DemoCommand() = default;

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("-b,--bars", bars_, "Number of task bars")
               ->check(CLI::Range(1, 256));
    subcommand->add_option("-w,--workers", workers_, "Worker threads")
               ->check(CLI::Range(1, 64));
    subcommand->add_option("-t,--total", total_, "Iterations per task");
    subcommand->add_option("-d,--delay-ms", delay_ms_, "Base delay per iteration in milliseconds")
               ->check(CLI::Range(0, 1000));
    subcommand->add_option("--max-rows", max_rows_, "Rows shown before the rest are folded (0: display.max_rows)")
               ->check(CLI::Range(0, 1000));
    addStyleOptions(subcommand);

    subcommand->callback([this]() { was_called_ = true; });
}

int DemoCommand::execute() {
    core::StyleConfig style;
    try {
        style = resolveStyle(style_name_, layout_name_);
    } catch (const core::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto registry = render::BarRegistry::global();
    if (max_rows_ > 0) {
        registry->setMaxRows(static_cast<size_t>(max_rows_));
    }

    common::Logger::instance().info("[Demo] Started | bars={} | workers={} | total={}",
                                    bars_, workers_, total_);

    core::ProgressBar overall(total_ * static_cast<uint64_t>(bars_),
                              fmt::format("{} workers", workers_), style);

    tbb::task_arena arena(workers_);
    arena.execute([&] {
        tbb::parallel_for(0, bars_, [&](int i) {
            auto bar = core::ProgressBar::likeOf(overall, total_, fmt::format("task{}", i));
            auto delay = std::chrono::milliseconds(delay_ms_ + i % 5);

            for (uint64_t n = 0; n < total_; ++n) {
                std::this_thread::sleep_for(delay);
                bar.inc();
                overall.inc();
                if ((n + 1) % 100 == 0) {
                    bar.setPostfix(fmt::format("batch={}", (n + 1) / 100));
                }
            }
            bar.finish();
        });
    });

    overall.finish();
    common::Logger::instance().info("[Demo] Finished | frames={}", registry->framesRendered());
    return 0;
}

}}
