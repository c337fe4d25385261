//! # Phase Scheduler
//!
//! Runs an ordered list of phases over every module of a `ModuleGraph`,
//! in parallel within a phase.
//!
//! ## Components
//!
//! | Class        | Description                                  |
//! |--------------|----------------------------------------------|
//! | `Phase`      | Named per-module step or global barrier      |
//! | `ReadyQueue` | Hands out modules whose predecessors are done |
//! | `PhaseStats` | Per-phase counters                           |
//! | `Scheduler`  | Runs phases with a worker pool               |
//!
//! ## Ordering
//!
//! | Order      | A module's step runs after...                    |
//! |------------|--------------------------------------------------|
//! | `BottomUp` | the steps of all its dependencies                |
//! | `TopDown`  | the steps of all its dependents                  |
//! | `Parallel` | nothing                                          |
//!
//! A phase orders modules by the graph's edges as they stand when it
//! starts, unless it supplies its own dependency lists (`Phase::edges`).
//! Phases that add the edges they are ordered by, such as dependency
//! discovery, must supply them up front. Phases are separated by a full
//! barrier.
//!
//! ## Failures
//!
//! A step returning `false` marks its module failed. Failed modules skip
//! every later step. In `BottomUp` phases the dependents of a failed module
//! are marked failed too (`G002`). Modules on a dependency cycle of an
//! ordered phase get a `G001` error and are skipped.

#ifndef TRANSBUILD_SCHED_SCHEDULER_HPP
#define TRANSBUILD_SCHED_SCHEDULER_HPP

#include "graph/module_graph.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <deque>
#include <set>
#include <string>
#include <vector>

namespace transbuild::sched {

enum class PhaseOrder {
    BottomUp,
    TopDown,
    Parallel,
};

[[nodiscard]] auto phase_order_name(PhaseOrder order) -> const char*;

/// Per-module step. Returns false when the step reported an error.
using StepFn = std::function<bool(graph::Module&)>;

/// Global action run between two phases.
using BarrierFn = std::function<void()>;

/// Dependency lists a phase is ordered by, one per module id.
using EdgesFn = std::function<graph::AdjacencyList()>;

struct Phase {
    std::string name;
    PhaseOrder order = PhaseOrder::Parallel;
    StepFn step;       ///< Set for module phases
    BarrierFn barrier; ///< Set for barriers
    EdgesFn edges;     ///< Graph edges at phase start when unset
};

/// Counters for one finished phase.
struct PhaseStats {
    std::string name;
    int ran = 0;
    int skipped = 0;
    int failed = 0;
    int64_t elapsed_ms = 0;
};

/// Hands out module ids once every module they wait for has completed.
///
/// Ids in `excluded` are never handed out and do not hold back the ids
/// waiting for them.
class ReadyQueue {
public:
    ReadyQueue(const graph::AdjacencyList& waits_for, const std::set<graph::ModuleId>& excluded);

    /// Blocks until an id is ready. Returns nullopt once every id completed.
    std::optional<graph::ModuleId> next();

    /// Marks `id` complete and releases the ids that were waiting on it.
    void complete(graph::ModuleId id);

private:
    graph::AdjacencyList waiters_;
    std::vector<size_t> pending_;
    std::deque<graph::ModuleId> ready_;
    size_t remaining_ = 0;
    std::mutex mutex_;
    std::condition_variable cv_;
};

class Scheduler {
public:
    /// `jobs` bounds the worker count; 0 uses the hardware concurrency.
    explicit Scheduler(graph::ModuleGraph& graph, int jobs = 0);

    void add_phase(std::string name, PhaseOrder order, StepFn step, EdgesFn edges = nullptr);
    void add_barrier(std::string name, BarrierFn barrier);

    /// Runs every phase in order.
    void run();

    /// Runs a single module phase over the whole graph.
    PhaseStats run_phase(const Phase& phase);

    [[nodiscard]] auto stats() const -> const std::vector<PhaseStats>& {
        return stats_;
    }

    [[nodiscard]] auto jobs() const -> int {
        return jobs_;
    }

private:
    graph::ModuleGraph& graph_;
    int jobs_;
    std::vector<Phase> phases_;
    std::vector<PhaseStats> stats_;
};

} // namespace transbuild::sched

#endif // TRANSBUILD_SCHED_SCHEDULER_HPP
