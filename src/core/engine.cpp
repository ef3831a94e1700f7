// src/core/engine.cpp
#include "abstractchain/core/engine.h"
#include "abstractchain/graph/graph_builder.h"
#include "abstractchain/rewriter/plan_rewriter.h"
#include <iostream>
#include <stdexcept>

namespace abstractchain {

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE:       return "none";
        case FailureKind::PLANNING:   return "planning";
        case FailureKind::GRAPH:      return "graph";
        case FailureKind::EXECUTION:  return "execution";
        case FailureKind::REWRITE:    return "rewrite";
        case FailureKind::REFINEMENT: return "refinement";
        case FailureKind::CANCELLED:  return "cancelled";
    }
    return "unknown";
}

AbstractChainEngine::AbstractChainEngine(const ToolRegistry& tools,
                                         LanguageModel* planner,
                                         LanguageModel* refiner,
                                         EngineConfig config)
    : tools_(tools),
      planner_(planner),
      refiner_(refiner != nullptr ? refiner : planner),
      config_(std::move(config)),
      prompts_(config_.reasoning_template, config_.refine_template) {
    config_.executor.verbose = config_.executor.verbose || config_.verbose;
    log("Tools available: " + std::to_string(tools_.list_tools().size()));
}

void AbstractChainEngine::log(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[abstractchain] " << message << std::endl;
    }
}

RunResult AbstractChainEngine::fail(RunResult result, FailureKind kind, std::string message) {
    result.success = false;
    result.failure = kind;
    result.message = std::move(message);
    result.filled_plan.clear();
    result.final_answer.clear();
    return result;
}

void AbstractChainEngine::cancel() {
    cancelled_.store(true);
    if (planner_ != nullptr) {
        planner_->cancel();
    }
    if (refiner_ != nullptr && refiner_ != planner_) {
        refiner_->cancel();
    }
    std::lock_guard<std::mutex> lock(executor_mutex_);
    if (active_executor_ != nullptr) {
        active_executor_->request_stop();
    }
}

RunResult AbstractChainEngine::execute_plan(const std::string& plan_text) {
    RunResult result;
    result.plan_text = plan_text;

    if (cancelled()) {
        return fail(std::move(result), FailureKind::CANCELLED, "Run cancelled before execution");
    }

    // 1. 解析
    ExpressionParser parser(tools_.list_tools());
    ParseOutput parsed = parser.parse(plan_text);
    result.diagnostics = parsed.diagnostics;
    for (const auto& diag : parsed.diagnostics) {
        if (config_.verbose) {
            std::cerr << "[abstractchain] warning at offset " << diag.offset << ": " << diag.message
                      << " in `" << diag.snippet << "`" << std::endl;
        }
    }
    log("Parsed " + std::to_string(parsed.calls.size()) + " call expression(s)");

    // 2. 构建依赖图
    std::optional<ExecutionPlan> plan;
    try {
        plan.emplace(GraphBuilder::build(plan_text, std::move(parsed.calls)));
    } catch (const GraphError& e) {
        return fail(std::move(result), FailureKind::GRAPH, std::string("Invalid plan: ") + e.what());
    }

    // 3. 执行
    PlanExecutor executor(tools_, config_.executor);
    {
        std::lock_guard<std::mutex> lock(executor_mutex_);
        active_executor_ = &executor;
        if (cancelled()) {
            executor.request_stop();
        }
    }
    auto detach = [this] {
        std::lock_guard<std::mutex> lock(executor_mutex_);
        active_executor_ = nullptr;
    };
    ExecutionReport report;
    try {
        report = executor.execute(*plan);
    } catch (const std::exception& e) {
        detach();
        result.results = plan->results();
        return fail(std::move(result), FailureKind::EXECUTION, std::string("Execution aborted: ") + e.what());
    }
    detach();

    result.results = report.results;
    result.traces = report.traces;
    if (!report.success) {
        result.failed_node = report.failed_node;
        FailureKind kind = report.stopped ? FailureKind::CANCELLED : FailureKind::EXECUTION;
        return fail(std::move(result), kind, "Could not complete the plan: " + report.message);
    }
    log(report.message);

    // 4. 回填
    try {
        result.filled_plan = PlanRewriter::rewrite(*plan);
    } catch (const RewriteError& e) {
        return fail(std::move(result), FailureKind::REWRITE, std::string("Could not fill the plan: ") + e.what());
    } catch (const std::exception& e) {
        return fail(std::move(result), FailureKind::REWRITE, std::string("Could not render results: ") + e.what());
    }

    result.success = true;
    result.message = report.message;
    return result;
}

RunResult AbstractChainEngine::run(const std::string& question) {
    RunResult result;
    result.question = question;

    if (cancelled()) {
        return fail(std::move(result), FailureKind::CANCELLED, "Run cancelled before planning");
    }
    if (planner_ == nullptr) {
        return fail(std::move(result), FailureKind::PLANNING, "No plan model configured");
    }

    std::string raw_plan;
    try {
        std::string prompt = prompts_.build_reasoning_prompt(tools_, question);
        raw_plan = planner_->generate(prompt);
    } catch (const std::exception& e) {
        return fail(std::move(result), FailureKind::PLANNING, std::string("Plan generation failed: ") + e.what());
    }
    log("Abstract plan:\n" + raw_plan);

    RunResult core = execute_plan(PromptBuilder::clean_plan(raw_plan));
    core.question = question;
    if (!core.success) {
        return core;
    }
    log("Filled plan:\n" + core.filled_plan);

    if (cancelled()) {
        return fail(std::move(core), FailureKind::CANCELLED, "Run cancelled before refinement");
    }

    std::string answer;
    try {
        std::string prompt = prompts_.build_refine_prompt(question, core.filled_plan);
        answer = refiner_->generate(prompt);
    } catch (const std::exception& e) {
        return fail(std::move(core), FailureKind::REFINEMENT, std::string("Refinement failed: ") + e.what());
    }

    core.final_answer = PromptBuilder::clean_answer(answer);
    core.success = true;
    return core;
}

} // namespace abstractchain
