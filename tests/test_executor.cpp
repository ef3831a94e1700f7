// tests/test_executor.cpp
#include <catch2/catch_test_macros.hpp>
#include "abstractchain/graph/graph_builder.h"
#include "abstractchain/parser/expression_parser.h"
#include "abstractchain/rewriter/plan_rewriter.h"
#include "abstractchain/scheduler/plan_executor.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace abstractchain;

namespace {

ExecutionPlan build_plan(const ToolRegistry& tools, const std::string& text) {
    ExpressionParser parser(tools.list_tools());
    auto parsed = parser.parse(text);
    return GraphBuilder::build(text, std::move(parsed.calls));
}

const TraceRecord& trace_of(const ExecutionReport& report, const std::string& id) {
    for (const auto& record : report.traces) {
        if (record.placeholder == id) return record;
    }
    throw std::runtime_error("no trace for " + id);
}

// Two tools that only return once both are running at the same time
struct Rendezvous {
    std::mutex mutex;
    std::condition_variable cv;
    int arrived = 0;

    bool arrive_and_wait() {
        std::unique_lock<std::mutex> lock(mutex);
        ++arrived;
        cv.notify_all();
        return cv.wait_for(lock, std::chrono::seconds(5), [this] { return arrived >= 2; });
    }
};

} // namespace

TEST_CASE("Sally plan executes in dependency order", "[executor]") {
    ToolRegistry tools;
    register_math_tools(tools);
    auto plan = build_plan(tools,
        "Sally has [FUNC add(3, 2) = y1] apples... multiplies by 3, [FUNC multiply(y1, 3) = y2] apples.");

    PlanExecutor executor(tools);
    auto report = executor.execute(plan);

    REQUIRE(report.success);
    REQUIRE(report.results["y1"] == 5);
    REQUIRE(report.results["y2"] == 15);
    REQUIRE(plan.node("y2").resolved_args == std::vector<Value>{5, 3});
    REQUIRE(plan.node("y1").status == NodeStatus::DONE);
    REQUIRE(plan.node("y2").status == NodeStatus::DONE);

    const auto& y1 = trace_of(report, "y1");
    const auto& y2 = trace_of(report, "y2");
    REQUIRE(y1.completion_seq.has_value());
    REQUIRE(*y1.completion_seq < y2.dispatch_seq);
    REQUIRE(y2.status == "done");
}

TEST_CASE("Independent calls run concurrently", "[executor]") {
    ToolRegistry tools;
    Rendezvous rendezvous;
    tools.register_tool("uber_10k", [&rendezvous](const std::vector<Value>& args) -> Value {
        if (!rendezvous.arrive_and_wait()) throw std::runtime_error("ran alone");
        return "Uber: " + args.at(0).get<std::string>();
    });
    tools.register_tool("lyft_10k", [&rendezvous](const std::vector<Value>& args) -> Value {
        if (!rendezvous.arrive_and_wait()) throw std::runtime_error("ran alone");
        return "Lyft: " + args.at(0).get<std::string>();
    });

    auto plan = build_plan(tools,
        R"(Uber said [FUNC uber_10k("revenue growth") = y1] while Lyft said [FUNC lyft_10k("revenue growth") = y2].)");

    PlanExecutor::Config config;
    config.max_concurrency = 2;
    PlanExecutor executor(tools, config);
    auto report = executor.execute(plan);

    REQUIRE(report.success);
    REQUIRE(report.results["y1"] == "Uber: revenue growth");
    REQUIRE(report.results["y2"] == "Lyft: revenue growth");
    REQUIRE(PlanRewriter::rewrite(plan) ==
            "Uber said Uber: revenue growth while Lyft said Lyft: revenue growth.");
}

TEST_CASE("Concurrency limit is respected", "[executor]") {
    ToolRegistry tools;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    tools.register_tool("work", [&](const std::vector<Value>& args) -> Value {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --running;
        return args.at(0);
    });

    auto plan = build_plan(tools, "[FUNC work(1) = y1] [FUNC work(2) = y2] [FUNC work(3) = y3] [FUNC work(4) = y4]");

    PlanExecutor::Config config;
    config.max_concurrency = 1;
    PlanExecutor executor(tools, config);
    auto report = executor.execute(plan);

    REQUIRE(report.success);
    REQUIRE(peak.load() == 1);
    REQUIRE(report.results.size() == 4);
}

TEST_CASE("Worker count follows the plan size", "[executor]") {
    ToolRegistry tools;
    PlanExecutor::Config config;
    config.max_concurrency = 4;
    PlanExecutor executor(tools, config);
    REQUIRE(executor.worker_count(2) == 2);
    REQUIRE(executor.worker_count(10) == 4);
    REQUIRE(executor.worker_count(0) == 1);

    config.max_concurrency = 0;
    PlanExecutor unbounded(tools, config);
    REQUIRE(unbounded.worker_count(64) >= 1);
}

TEST_CASE("Failed call halts the plan", "[executor]") {
    ToolRegistry tools;
    register_math_tools(tools);
    std::atomic<int> multiply_calls{0};
    tools.register_tool("broken_add", [](const std::vector<Value>&) -> Value {
        throw std::runtime_error("adder offline");
    });
    tools.register_tool("counting_multiply", [&multiply_calls](const std::vector<Value>& args) -> Value {
        ++multiply_calls;
        return args.at(0).get<int64_t>() * args.at(1).get<int64_t>();
    });

    auto plan = build_plan(tools,
        "Sally has [FUNC broken_add(3, 2) = y1] apples, then [FUNC counting_multiply(y1, 3) = y2] apples.");

    PlanExecutor executor(tools);
    auto report = executor.execute(plan);

    REQUIRE_FALSE(report.success);
    REQUIRE_FALSE(report.stopped);
    REQUIRE(report.failed_node == std::optional<Placeholder>("y1"));
    REQUIRE(report.failed_function == "broken_add");
    REQUIRE(report.failed_arguments == std::vector<Value>{3, 2});
    REQUIRE(report.message.find("broken_add(3, 2)") != std::string::npos);
    REQUIRE(report.message.find("adder offline") != std::string::npos);
    REQUIRE(multiply_calls.load() == 0);

    REQUIRE(plan.node("y1").status == NodeStatus::FAILED);
    REQUIRE(plan.node("y2").status == NodeStatus::PENDING);
    REQUIRE(trace_of(report, "y1").status == "failed");
    REQUIRE_THROWS_AS(PlanRewriter::rewrite(plan), RewriteError);
}

TEST_CASE("Completed results survive a later failure", "[executor]") {
    ToolRegistry tools;
    register_math_tools(tools);
    auto plan = build_plan(tools, "[FUNC add(1, 2) = y1] then [FUNC divide(y1, 0) = y2]");

    PlanExecutor executor(tools);
    auto report = executor.execute(plan);

    REQUIRE_FALSE(report.success);
    REQUIRE(report.failed_node == std::optional<Placeholder>("y2"));
    REQUIRE(report.failure_reason.find("Division by zero") != std::string::npos);
    REQUIRE(report.results["y1"] == 3);
    REQUIRE_FALSE(report.results.contains("y2"));
}

TEST_CASE("Stop request prevents further dispatch", "[executor]") {
    ToolRegistry tools;
    register_math_tools(tools);

    SECTION("before execution") {
        auto plan = build_plan(tools, "[FUNC add(1, 2) = y1]");
        PlanExecutor executor(tools);
        executor.request_stop();
        auto report = executor.execute(plan);
        REQUIRE_FALSE(report.success);
        REQUIRE(report.stopped);
        REQUIRE(report.traces.empty());
        REQUIRE(plan.node("y1").status == NodeStatus::READY);
    }

    SECTION("while a call is running") {
        PlanExecutor* active = nullptr;
        tools.register_tool("stopper", [&active](const std::vector<Value>&) -> Value {
            active->request_stop();
            return 1;
        });
        auto plan = build_plan(tools, "[FUNC stopper() = y1] then [FUNC add(y1, 1) = y2]");
        PlanExecutor executor(tools);
        active = &executor;
        auto report = executor.execute(plan);

        REQUIRE(report.stopped);
        REQUIRE(report.results["y1"] == 1);
        REQUIRE_FALSE(report.results.contains("y2"));
        REQUIRE(report.message.find("1 call(s) not executed") != std::string::npos);
    }
}

TEST_CASE("Empty plan succeeds without dispatch", "[executor]") {
    ToolRegistry tools;
    auto plan = build_plan(tools, "Nothing to compute here.");
    PlanExecutor executor(tools);
    auto report = executor.execute(plan);
    REQUIRE(report.success);
    REQUIRE(report.traces.empty());
    REQUIRE(PlanRewriter::rewrite(plan) == "Nothing to compute here.");
}

TEST_CASE("Failure message survives invalid UTF-8 arguments", "[executor]") {
    ToolRegistry tools;
    tools.register_tool("lookup", [](const std::vector<Value>&) -> Value {
        throw std::runtime_error("not found");
    });
    auto plan = build_plan(tools, "Menu: [FUNC lookup(\"caf\xe9\") = y1].");

    PlanExecutor executor(tools);
    ExecutionReport report;
    REQUIRE_NOTHROW(report = executor.execute(plan));

    REQUIRE_FALSE(report.success);
    REQUIRE(report.failed_node == std::optional<Placeholder>("y1"));
    REQUIRE(report.message.find("lookup(\"caf\xEF\xBF\xBD\")") != std::string::npos);
}

TEST_CASE("Tool throwing a non-standard exception fails its node", "[executor]") {
    ToolRegistry tools;
    register_math_tools(tools);
    tools.register_tool("legacy", [](const std::vector<Value>&) -> Value { throw 42; });
    auto plan = build_plan(tools, "[FUNC legacy() = y1] then [FUNC add(y1, 1) = y2]");

    PlanExecutor executor(tools);
    auto report = executor.execute(plan);

    REQUIRE_FALSE(report.success);
    REQUIRE(report.failed_node == std::optional<Placeholder>("y1"));
    REQUIRE(report.failure_reason == "Tool execution failed: unknown exception");
    REQUIRE(plan.node("y1").status == NodeStatus::FAILED);
    REQUIRE(plan.node("y2").status == NodeStatus::PENDING);
}

TEST_CASE("Independent call in flight at failure keeps its result", "[executor]") {
    ToolRegistry tools;
    Rendezvous rendezvous;
    tools.register_tool("fail_fast", [&rendezvous](const std::vector<Value>&) -> Value {
        rendezvous.arrive_and_wait();
        throw std::runtime_error("fast failure");
    });
    tools.register_tool("slow_ok", [&rendezvous](const std::vector<Value>&) -> Value {
        rendezvous.arrive_and_wait();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return 7;
    });
    auto plan = build_plan(tools, "[FUNC fail_fast() = y1] and [FUNC slow_ok() = y2]");

    PlanExecutor::Config config;
    config.max_concurrency = 2;
    PlanExecutor executor(tools, config);
    auto report = executor.execute(plan);

    REQUIRE_FALSE(report.success);
    REQUIRE(report.failed_node == std::optional<Placeholder>("y1"));
    REQUIRE(report.results.contains("y2"));
    REQUIRE(report.results["y2"] == 7);
    REQUIRE(plan.node("y2").status == NodeStatus::DONE);
    REQUIRE(trace_of(report, "y2").status == "done");
}
