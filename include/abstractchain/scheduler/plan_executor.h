// abstractchain/scheduler/plan_executor.h
#ifndef ABSTRACTCHAIN_SCHEDULER_PLAN_EXECUTOR_H
#define ABSTRACTCHAIN_SCHEDULER_PLAN_EXECUTOR_H

#include "abstractchain/graph/execution_plan.h"
#include "abstractchain/tools/registry.h"
#include "abstractchain/trace/trace_exporter.h"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace abstractchain {

struct ExecutionReport {
    bool success = false;
    bool stopped = false;                  // request_stop() cut the run short
    std::string message;

    // Set when a tool call failed (the first failure wins)
    std::optional<Placeholder> failed_node;
    std::string failed_function;
    std::vector<Value> failed_arguments;
    std::string failure_reason;

    Value results = Value::object();       // every completed placeholder, kept on failure too
    std::vector<TraceRecord> traces;
};

// Walks an ExecutionPlan in dependency order.
//
// The calling thread is the coordinator: it owns every status write on the
// plan, dispatches ready nodes to a bounded worker pool and collects results
// from a completion queue. Workers only invoke tools. A failed node halts
// dispatch; calls already in flight are allowed to finish.
struct PlanExecutorConfig {
    size_t max_concurrency = 4;   // 0 = hardware threads
    bool verbose = false;
};

class PlanExecutor {
public:
    using Config = PlanExecutorConfig;

    explicit PlanExecutor(const ToolRegistry& tools, Config config = {});

    ExecutionReport execute(ExecutionPlan& plan);

    // Cooperative: in-flight calls complete, nothing new is dispatched
    void request_stop();
    bool stop_requested() const noexcept;

    size_t worker_count(size_t plan_size) const;

private:
    const ToolRegistry& tools_;
    Config config_;
    std::atomic<bool> stop_requested_{false};

    static std::vector<Value> resolve_arguments(const ExecutionPlan& plan, const DependencyNode& node);
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_SCHEDULER_PLAN_EXECUTOR_H
