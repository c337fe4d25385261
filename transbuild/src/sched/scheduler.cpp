//! # Phase Scheduler
//!
//! ## Architecture
//!
//! ```text
//! Scheduler::run_phase
//!   ├─ dependency lists      # Phase::edges, or graph edges at phase start
//!   ├─ cycle detection       # G001 for modules on cycles
//!   ├─ ReadyQueue            # pending counts, ready modules
//!   └─ worker threads        # next, run step, complete
//! ```
//!
//! ## Thread Safety
//!
//! | Component    | Synchronization                      |
//! |--------------|--------------------------------------|
//! | ReadyQueue   | Mutex + condition variable           |
//! | counters     | Atomic                               |
//! | Module state | Written by the owning step only      |

#include "sched/scheduler.hpp"

#include "common.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace transbuild::sched {

auto phase_order_name(PhaseOrder order) -> const char* {
    switch (order) {
    case PhaseOrder::BottomUp:
        return "bottom_up";
    case PhaseOrder::TopDown:
        return "top_down";
    case PhaseOrder::Parallel:
        return "parallel";
    }
    return "parallel";
}

// ============================================================================
// ReadyQueue Implementation
// ============================================================================

ReadyQueue::ReadyQueue(const graph::AdjacencyList& waits_for,
                       const std::set<graph::ModuleId>& excluded)
    : waiters_(waits_for.size()), pending_(waits_for.size(), 0) {
    for (graph::ModuleId id = 0; id < waits_for.size(); ++id) {
        if (excluded.contains(id)) {
            continue;
        }
        ++remaining_;
        for (graph::ModuleId dep : waits_for[id]) {
            if (!excluded.contains(dep)) {
                waiters_[dep].push_back(id);
                ++pending_[id];
            }
        }
        if (pending_[id] == 0) {
            ready_.push_back(id);
        }
    }
}

std::optional<graph::ModuleId> ReadyQueue::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !ready_.empty() || remaining_ == 0; });
    if (ready_.empty()) {
        return std::nullopt;
    }
    auto id = ready_.front();
    ready_.pop_front();
    return id;
}

void ReadyQueue::complete(graph::ModuleId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    --remaining_;
    for (graph::ModuleId waiter : waiters_[id]) {
        if (--pending_[waiter] == 0) {
            ready_.push_back(waiter);
        }
    }
    cv_.notify_all();
}

// ============================================================================
// Scheduler Implementation
// ============================================================================

namespace {

/// Counters shared by the workers of one phase run.
struct PhaseCounters {
    std::atomic<int> ran{0};
    std::atomic<int> skipped{0};
    std::atomic<int> failed{0};
};

} // namespace

Scheduler::Scheduler(graph::ModuleGraph& graph, int jobs) : graph_(graph), jobs_(jobs) {
    if (jobs_ <= 0) {
        jobs_ = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
}

void Scheduler::add_phase(std::string name, PhaseOrder order, StepFn step, EdgesFn edges) {
    Phase phase;
    phase.name = std::move(name);
    phase.order = order;
    phase.step = std::move(step);
    phase.edges = std::move(edges);
    phases_.push_back(std::move(phase));
}

void Scheduler::add_barrier(std::string name, BarrierFn barrier) {
    Phase phase;
    phase.name = std::move(name);
    phase.barrier = std::move(barrier);
    phases_.push_back(std::move(phase));
}

void Scheduler::run() {
    stats_.clear();
    for (const auto& phase : phases_) {
        if (phase.barrier) {
            auto start = std::chrono::steady_clock::now();
            TRANSBUILD_LOG_DEBUG("sched", "Barrier " << phase.name);
            phase.barrier();
            PhaseStats stats;
            stats.name = phase.name;
            stats.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - start)
                                   .count();
            stats_.push_back(std::move(stats));
        } else {
            stats_.push_back(run_phase(phase));
        }
    }
}

PhaseStats Scheduler::run_phase(const Phase& phase) {
    auto start = std::chrono::steady_clock::now();
    PhaseStats stats;
    stats.name = phase.name;

    const size_t n = graph_.size();
    if (n == 0) {
        return stats;
    }

    PhaseCounters run;
    // Real dependencies, for failure propagation
    graph::AdjacencyList deps = phase.edges ? phase.edges() : graph_.dependency_lists();
    if (deps.size() != n) {
        fatal("sched", "phase " + phase.name + " supplied " + std::to_string(deps.size()) +
                           " dependency lists for " + std::to_string(n) + " modules");
    }

    // A module waits for the modules in `order_deps[id]`
    graph::AdjacencyList order_deps;
    switch (phase.order) {
    case PhaseOrder::BottomUp:
        order_deps = deps;
        break;
    case PhaseOrder::TopDown:
        order_deps = graph::ModuleGraph::reverse(deps);
        break;
    case PhaseOrder::Parallel:
        order_deps.assign(n, {});
        break;
    }

    std::set<graph::ModuleId> on_cycle;
    if (phase.order != PhaseOrder::Parallel) {
        on_cycle = graph::ModuleGraph::cycle_members(order_deps);
    }

    for (graph::ModuleId id : on_cycle) {
        auto& module = graph_.module(id);
        if (!module.failed) {
            module.error(ErrorCodes::GRAPH_CYCLE, "module is on a dependency cycle in phase \"" +
                                                      phase.name + "\"");
            module.failed = true;
            ++run.failed;
        } else {
            ++run.skipped;
        }
    }

    ReadyQueue queue(order_deps, on_cycle);

    int workers_count = std::min(static_cast<int>(n), jobs_);
    TRANSBUILD_LOG_INFO("sched", "Phase " << phase.name << " (" << phase_order_name(phase.order)
                                          << ") over " << n << " modules with "
                                          << workers_count << " workers");

    auto process = [&](graph::ModuleId id) {
        auto& module = graph_.module(id);
        if (module.failed) {
            ++run.skipped;
            return;
        }

        if (phase.order == PhaseOrder::BottomUp) {
            for (graph::ModuleId dep : deps[id]) {
                const auto& dep_module = graph_.module(dep);
                if (dep_module.failed) {
                    module.error(ErrorCodes::GRAPH_DEPENDENCY_FAILED,
                                 "dependency \"" + dep_module.name() + "\" failed");
                    module.failed = true;
                    ++run.failed;
                    return;
                }
            }
        }

        log::ModuleScope scope(module.name());
        if (phase.step(module)) {
            ++run.ran;
        } else {
            TRANSBUILD_LOG_DEBUG("sched", "Step " << phase.name << " failed for "
                                                  << module.name());
            module.failed = true;
            ++run.failed;
        }
    };

    auto worker = [&]() {
        while (auto id = queue.next()) {
            process(*id);
            queue.complete(*id);
        }
    };

    std::vector<std::thread> workers;
    for (int i = 0; i < workers_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& w : workers) {
        w.join();
    }

    stats.ran = run.ran;
    stats.skipped = run.skipped;
    stats.failed = run.failed;
    stats.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();

    TRANSBUILD_LOG_INFO("sched", "Phase " << phase.name << " finished in " << stats.elapsed_ms
                                          << "ms: " << stats.ran << " ran, " << stats.skipped
                                          << " skipped, " << stats.failed << " failed");
    return stats;
}

} // namespace transbuild::sched
