//! # Scheduler Tests
//!
//! Phase ordering, failure propagation, cycles and barriers.

#include "log/log.hpp"
#include "sched/scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace transbuild;
using namespace transbuild::graph;
using namespace transbuild::sched;

// ============================================================================
// ReadyQueue
// ============================================================================

TEST(ReadyQueueTest, ReleasesWaitersOnCompletion) {
    // 0 waits for 1, 2 waits for 0 and 1
    ReadyQueue queue({{1}, {}, {0, 1}}, {});

    EXPECT_EQ(queue.next(), std::optional<ModuleId>(1));
    queue.complete(1);
    EXPECT_EQ(queue.next(), std::optional<ModuleId>(0));
    queue.complete(0);
    EXPECT_EQ(queue.next(), std::optional<ModuleId>(2));
    queue.complete(2);
    EXPECT_FALSE(queue.next().has_value());
}

TEST(ReadyQueueTest, ExcludedIdsNeverHandedOut) {
    // 0 and 1 wait for each other, 2 waits for 0
    ReadyQueue queue({{1}, {0}, {0}}, {0, 1});

    EXPECT_EQ(queue.next(), std::optional<ModuleId>(2));
    queue.complete(2);
    EXPECT_FALSE(queue.next().has_value());
}

TEST(ReadyQueueTest, NextBlocksUntilReleased) {
    ReadyQueue queue({{}, {0}}, {});
    ASSERT_EQ(queue.next(), std::optional<ModuleId>(0));

    std::optional<ModuleId> released;
    std::thread waiter([&] { released = queue.next(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.complete(0);
    waiter.join();

    EXPECT_EQ(released, std::optional<ModuleId>(1));
}

// ============================================================================
// Scheduler
// ============================================================================

class SchedulerTest : public ::testing::Test {
protected:
    ModuleGraph graph;
    std::mutex order_mutex;
    std::vector<std::string> order;

    auto add(const std::string& name) -> ModuleId {
        ModuleDecl decl;
        decl.name = name;
        decl.type = "filegroup";
        auto result = graph.add_module(std::move(decl));
        EXPECT_TRUE(is_ok(result));
        return is_ok(result) ? unwrap(result) : 0;
    }

    auto recorder(std::string fail_on = "") -> StepFn {
        return [this, fail_on](Module& module) {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(module.name());
            return module.name() != fail_on;
        };
    }

    auto position(const std::string& name) -> size_t {
        return static_cast<size_t>(std::find(order.begin(), order.end(), name) - order.begin());
    }

    static auto has_code(const Module& module, const char* code) -> bool {
        return std::any_of(module.diagnostics.begin(), module.diagnostics.end(),
                           [&](const Diagnostic& d) { return d.code == code; });
    }
};

TEST_F(SchedulerTest, BottomUpRunsDependenciesFirst) {
    // app -> lib -> base, app -> base
    auto app = add("app");
    auto lib = add("lib");
    auto base = add("base");
    graph.add_edge(app, lib, DependencyTag::Ordinary);
    graph.add_edge(lib, base, DependencyTag::Ordinary);
    graph.add_edge(app, base, DependencyTag::Ordinary);

    Scheduler scheduler(graph, 4);
    scheduler.add_phase("convert", PhaseOrder::BottomUp, recorder());
    scheduler.run();

    ASSERT_EQ(order.size(), 3u);
    EXPECT_LT(position("base"), position("lib"));
    EXPECT_LT(position("lib"), position("app"));
    ASSERT_EQ(scheduler.stats().size(), 1u);
    EXPECT_EQ(scheduler.stats()[0].ran, 3);
}

TEST_F(SchedulerTest, StepsRunInModuleLogScope) {
    add("app");
    add("lib");

    std::mutex mutex;
    std::vector<std::string> mismatched;
    Scheduler scheduler(graph, 2);
    scheduler.add_phase("scoped", PhaseOrder::Parallel, [&](Module& module) {
        if (log::current_module() != module.name()) {
            std::lock_guard<std::mutex> lock(mutex);
            mismatched.push_back(module.name());
        }
        return true;
    });
    scheduler.run();

    EXPECT_TRUE(mismatched.empty());
    EXPECT_TRUE(log::current_module().empty());
}

TEST_F(SchedulerTest, TopDownRunsDependentsFirst) {
    auto app = add("app");
    auto lib = add("lib");
    graph.add_edge(app, lib, DependencyTag::Ordinary);

    Scheduler scheduler(graph, 2);
    scheduler.add_phase("mark", PhaseOrder::TopDown, recorder());
    scheduler.run();

    EXPECT_EQ(order, (std::vector<std::string>{"app", "lib"}));
}

TEST_F(SchedulerTest, ParallelPhaseRunsEveryModule) {
    for (int i = 0; i < 50; ++i) {
        add("m" + std::to_string(i));
    }
    for (ModuleId id = 1; id < graph.size(); ++id) {
        graph.add_edge(id, id - 1, DependencyTag::Ordinary);
    }

    std::atomic<int> count{0};
    Scheduler scheduler(graph, 8);
    auto stats = scheduler.run_phase(Phase{"deps", PhaseOrder::Parallel,
                                           [&count](Module&) {
                                               ++count;
                                               return true;
                                           },
                                           nullptr});

    EXPECT_EQ(count.load(), 50);
    EXPECT_EQ(stats.ran, 50);
}

TEST_F(SchedulerTest, FailurePropagatesBottomUp) {
    auto app = add("app");
    auto lib = add("lib");
    auto other = add("other");
    graph.add_edge(app, lib, DependencyTag::Ordinary);

    Scheduler scheduler(graph, 2);
    scheduler.add_phase("convert", PhaseOrder::BottomUp, recorder("lib"));
    scheduler.add_phase("later", PhaseOrder::Parallel, recorder());
    scheduler.run();

    EXPECT_TRUE(graph.module(lib).failed);
    EXPECT_TRUE(graph.module(app).failed);
    EXPECT_TRUE(has_code(graph.module(app), ErrorCodes::GRAPH_DEPENDENCY_FAILED));
    EXPECT_FALSE(graph.module(other).failed);

    // Only "other" reaches the second phase
    EXPECT_EQ(std::count(order.begin(), order.end(), "other"), 2);
    EXPECT_EQ(std::count(order.begin(), order.end(), "app"), 0);

    const auto& stats = scheduler.stats();
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats[0].failed, 2);
    EXPECT_EQ(stats[1].skipped, 2);
    EXPECT_EQ(stats[1].ran, 1);
}

TEST_F(SchedulerTest, FailureDoesNotPropagateTopDown) {
    auto app = add("app");
    auto lib = add("lib");
    graph.add_edge(app, lib, DependencyTag::Ordinary);

    Scheduler scheduler(graph, 2);
    scheduler.add_phase("mark", PhaseOrder::TopDown, recorder("app"));
    scheduler.run();

    EXPECT_TRUE(graph.module(app).failed);
    EXPECT_FALSE(graph.module(lib).failed);
}

TEST_F(SchedulerTest, CycleMembersFailOthersContinue) {
    auto a = add("a");
    auto b = add("b");
    auto c = add("c");
    auto free_module = add("free");
    graph.add_edge(a, b, DependencyTag::Ordinary);
    graph.add_edge(b, a, DependencyTag::Ordinary);
    graph.add_edge(c, a, DependencyTag::Ordinary);

    Scheduler scheduler(graph, 2);
    scheduler.add_phase("convert", PhaseOrder::BottomUp, recorder());
    scheduler.run();

    EXPECT_TRUE(has_code(graph.module(a), ErrorCodes::GRAPH_CYCLE));
    EXPECT_TRUE(has_code(graph.module(b), ErrorCodes::GRAPH_CYCLE));
    EXPECT_TRUE(has_code(graph.module(c), ErrorCodes::GRAPH_DEPENDENCY_FAILED));
    EXPECT_FALSE(graph.module(free_module).failed);
    EXPECT_EQ(order, (std::vector<std::string>{"free"}));
}

TEST_F(SchedulerTest, BarrierRunsBetweenPhases) {
    add("a");
    add("b");

    std::vector<std::string> events;
    std::mutex events_mutex;
    auto step = [&](const char* phase) {
        return [&events, &events_mutex, phase](Module&) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(phase);
            return true;
        };
    };

    Scheduler scheduler(graph, 2);
    scheduler.add_phase("queue", PhaseOrder::Parallel, step("queue"));
    scheduler.add_barrier("answer", [&events] { events.push_back("barrier"); });
    scheduler.add_phase("process", PhaseOrder::Parallel, step("process"));
    scheduler.run();

    EXPECT_EQ(events, (std::vector<std::string>{"queue", "queue", "barrier", "process",
                                                "process"}));
    ASSERT_EQ(scheduler.stats().size(), 3u);
    EXPECT_EQ(scheduler.stats()[1].name, "answer");
}

TEST_F(SchedulerTest, EdgesAddedInEarlierPhaseOrderLaterPhases) {
    auto app = add("app");
    auto lib = add("lib");

    Scheduler scheduler(graph, 2);
    scheduler.add_phase("deps", PhaseOrder::Parallel, [&](Module& module) {
        if (module.id == app) {
            graph.add_edge(app, lib, DependencyTag::Ordinary);
        }
        return true;
    });
    scheduler.add_phase("convert", PhaseOrder::BottomUp, recorder());
    scheduler.run();

    EXPECT_EQ(order, (std::vector<std::string>{"lib", "app"}));
}

TEST_F(SchedulerTest, SuppliedEdgesOrderPhaseThatAddsThem) {
    auto app = add("app");
    auto lib = add("lib");

    // The step adds the edge itself; the phase is ordered by the lists it supplies
    Scheduler scheduler(graph, 1);
    scheduler.add_phase(
        "deps", PhaseOrder::BottomUp,
        [&](Module& module) {
            {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(module.name());
            }
            if (module.id == app) {
                graph.add_edge(app, lib, DependencyTag::Ordinary);
            }
            return module.id != lib;
        },
        [&] {
            AdjacencyList lists(graph.size());
            lists[app] = {lib};
            return lists;
        });
    scheduler.run();

    EXPECT_EQ(order, (std::vector<std::string>{"lib"}));
    EXPECT_TRUE(has_code(graph.module(app), ErrorCodes::GRAPH_DEPENDENCY_FAILED));
    EXPECT_EQ(scheduler.stats()[0].failed, 2);
}

TEST(SchedulerJobsTest, ZeroUsesHardwareConcurrency) {
    ModuleGraph graph;
    Scheduler scheduler(graph, 0);
    EXPECT_GE(scheduler.jobs(), 1);

    auto stats = scheduler.run_phase(Phase{"empty", PhaseOrder::BottomUp,
                                           [](Module&) { return true; }, nullptr});
    EXPECT_EQ(stats.ran, 0);
}
