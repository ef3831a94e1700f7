// abstractchain/core/engine.h
#ifndef ABSTRACTCHAIN_CORE_ENGINE_H
#define ABSTRACTCHAIN_CORE_ENGINE_H

#include "abstractchain/core/config.h"
#include "abstractchain/llm/language_model.h"
#include "abstractchain/llm/prompt_builder.h"
#include "abstractchain/parser/expression_parser.h"
#include "abstractchain/scheduler/plan_executor.h"
#include "abstractchain/tools/registry.h"
#include "abstractchain/trace/trace_exporter.h"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace abstractchain {

enum class FailureKind : uint8_t {
    NONE,
    PLANNING,     // plan model failed
    GRAPH,        // duplicate placeholder, unknown reference, cycle
    EXECUTION,    // a tool call failed
    REWRITE,      // graph and text disagree
    REFINEMENT,   // refine model failed
    CANCELLED
};

const char* to_string(FailureKind kind);

struct RunResult {
    bool success = false;
    FailureKind failure = FailureKind::NONE;
    std::string message;

    std::string question;
    std::string plan_text;        // model output after label cleanup
    std::string filled_plan;      // empty unless every call was substituted
    std::string final_answer;     // empty unless the run succeeded

    Value results = Value::object();
    std::optional<Placeholder> failed_node;
    std::vector<ParseDiagnostic> diagnostics;
    std::vector<TraceRecord> traces;
};

// Drives one task: reasoning prompt -> plan model -> parse -> graph ->
// execute -> rewrite -> refine prompt -> refine model.
// Every fatal condition comes back as a failed RunResult; model exceptions
// are caught at the two model boundaries.
class AbstractChainEngine {
public:
    // `refiner` defaults to `planner`. A null planner still allows execute_plan().
    AbstractChainEngine(const ToolRegistry& tools,
                        LanguageModel* planner,
                        LanguageModel* refiner = nullptr,
                        EngineConfig config = {});

    RunResult run(const std::string& question);

    // The model-free core: parse, build, execute and rewrite `plan_text`
    RunResult execute_plan(const std::string& plan_text);

    // Sticky. Checked before each model call, forwarded to both models and
    // stops dispatch in a running plan.
    void cancel();
    bool cancelled() const noexcept { return cancelled_.load(); }

    const EngineConfig& config() const { return config_; }

private:
    const ToolRegistry& tools_;
    LanguageModel* planner_;
    LanguageModel* refiner_;
    EngineConfig config_;
    PromptBuilder prompts_;

    std::atomic<bool> cancelled_{false};
    std::mutex executor_mutex_;
    PlanExecutor* active_executor_ = nullptr;

    void log(const std::string& message) const;
    static RunResult fail(RunResult result, FailureKind kind, std::string message);
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_CORE_ENGINE_H
