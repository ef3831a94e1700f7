// src/scheduler/plan_executor.cpp
#include "abstractchain/scheduler/plan_executor.h"
#include "abstractchain/scheduler/worker_pool.h"
#include "common/utils.h"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>

namespace abstractchain {

namespace {

struct Completion {
    size_t index;
    ToolResult result;
};

// Workers push, the coordinator pops
class CompletionQueue {
public:
    void push(Completion completion) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(completion));
        }
        condition_.notify_one();
    }

    Completion pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return !queue_.empty(); });
        Completion completion = std::move(queue_.front());
        queue_.pop_front();
        return completion;
    }

private:
    std::deque<Completion> queue_;
    std::condition_variable condition_;
    std::mutex mutex_;
};

} // namespace

PlanExecutor::PlanExecutor(const ToolRegistry& tools, Config config)
    : tools_(tools), config_(config) {}

void PlanExecutor::request_stop() {
    stop_requested_.store(true);
}

bool PlanExecutor::stop_requested() const noexcept {
    return stop_requested_.load();
}

size_t PlanExecutor::worker_count(size_t plan_size) const {
    size_t limit = config_.max_concurrency;
    if (limit == 0) {
        limit = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(limit, plan_size));
}

std::vector<Value> PlanExecutor::resolve_arguments(const ExecutionPlan& plan, const DependencyNode& node) {
    std::vector<Value> args;
    args.reserve(node.arguments.size());
    for (const auto& arg : node.arguments) {
        if (arg.is_reference()) {
            // dependencies are DONE before dispatch, so the result is present
            args.push_back(plan.node(arg.reference).result.value());
        } else {
            args.push_back(arg.literal);
        }
    }
    return args;
}

ExecutionReport PlanExecutor::execute(ExecutionPlan& plan) {
    ExecutionReport report;
    TraceExporter trace;

    if (plan.empty()) {
        report.success = true;
        report.message = "No calls to execute";
        return report;
    }

    auto& nodes = plan.nodes();

    // 1. 初始化入度
    std::vector<size_t> in_degree(nodes.size(), 0);
    std::deque<size_t> ready_queue;
    for (size_t i = 0; i < nodes.size(); ++i) {
        in_degree[i] = nodes[i].dependencies.size();
        if (in_degree[i] == 0) {
            nodes[i].status = NodeStatus::READY;
            ready_queue.push_back(i);
        }
    }

    const size_t limit = worker_count(nodes.size());
    CompletionQueue completions;
    WorkerPool pool(limit);   // joined before `completions` goes away

    size_t in_flight = 0;
    bool halted = false;

    auto dispatch = [&](size_t index) {
        DependencyNode& node = nodes[index];
        node.resolved_args = resolve_arguments(plan, node);
        node.status = NodeStatus::RUNNING;
        trace.on_dispatch(node);
        if (config_.verbose) {
            std::cout << "[abstractchain] dispatch " << node.id << " = " << node.function_name
                      << "(" << join_values(node.resolved_args) << ")" << std::endl;
        }

        ++in_flight;
        pool.enqueue([this, index, &completions, name = node.function_name, args = node.resolved_args] {
            completions.push({index, tools_.call_tool(name, args)});
        });
    };

    // 2. 调度循环
    while (true) {
        while (!halted && !stop_requested() && !ready_queue.empty() && in_flight < limit) {
            size_t index = ready_queue.front();
            ready_queue.pop_front();
            dispatch(index);
        }
        if (in_flight == 0) {
            break;
        }

        Completion completion = completions.pop();
        --in_flight;

        DependencyNode& node = nodes[completion.index];
        if (completion.result.success) {
            node.result = std::move(completion.result.value);
            node.status = NodeStatus::DONE;
            trace.on_complete(node);
            for (size_t dependent : plan.dependents(completion.index)) {
                if (--in_degree[dependent] == 0) {
                    nodes[dependent].status = NodeStatus::READY;
                    ready_queue.push_back(dependent);
                }
            }
        } else {
            node.status = NodeStatus::FAILED;
            node.error = completion.result.error;
            trace.on_complete(node);
            if (config_.verbose) {
                std::cerr << "[abstractchain] " << node.id << " failed: " << node.error << std::endl;
            }
            if (!halted) {
                halted = true;
                report.failed_node = node.id;
                report.failed_function = node.function_name;
                report.failed_arguments = node.resolved_args;
                report.failure_reason = node.error;
            }
        }
    }

    pool.stop_all();

    report.results = plan.results();
    report.traces = trace.get_traces();

    if (report.failed_node) {
        report.success = false;
        report.message = "Tool call failed for " + *report.failed_node + " = " + report.failed_function +
                         "(" + join_values(report.failed_arguments) + "): " + report.failure_reason;
        return report;
    }

    size_t unfinished = std::count_if(nodes.begin(), nodes.end(),
                                      [](const DependencyNode& n) { return n.status != NodeStatus::DONE; });
    if (unfinished == 0) {
        report.success = true;
        report.message = "Executed " + std::to_string(nodes.size()) + " call(s)";
    } else if (stop_requested()) {
        report.success = false;
        report.stopped = true;
        report.message = "Execution stopped with " + std::to_string(unfinished) + " call(s) not executed";
    } else {
        report.success = false;
        report.message = "Execution stalled: " + std::to_string(unfinished) + " call(s) never became ready";
    }
    return report;
}

} // namespace abstractchain
