// src/rewriter/plan_rewriter.cpp
#include "abstractchain/rewriter/plan_rewriter.h"
#include "common/utils.h"
#include <algorithm>

namespace abstractchain {

std::string PlanRewriter::rewrite(const ExecutionPlan& plan) {
    const std::string& text = plan.text();

    std::vector<const CallExpression*> ordered;
    ordered.reserve(plan.calls().size());
    for (const auto& call : plan.calls()) {
        ordered.push_back(&call);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const CallExpression* a, const CallExpression* b) {
        return a->source_span.begin < b->source_span.begin;
    });

    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;

    for (const CallExpression* call : ordered) {
        const SourceSpan& span = call->source_span;
        if (span.begin < cursor || span.end() > text.size()) {
            throw RewriteError(PlanErrorCode::OVERLAPPING_SPANS,
                               "Call expression for '" + call->output_placeholder +
                                   "' overlaps a previous expression or lies outside the plan text",
                               {call->output_placeholder});
        }

        const DependencyNode* node = plan.find(call->output_placeholder);
        if (node == nullptr || node->status != NodeStatus::DONE || !node->result) {
            std::string state = node == nullptr ? "missing" : to_string(node->status);
            throw RewriteError(PlanErrorCode::UNRESOLVED_PLACEHOLDER,
                               "Cannot substitute '" + call->output_placeholder + "' (" + call->function_name +
                                   "): node is " + state,
                               {call->output_placeholder});
        }

        out.append(text, cursor, span.begin - cursor);
        out += render_value(*node->result);
        cursor = span.end();
    }

    out.append(text, cursor, std::string::npos);
    return out;
}

} // namespace abstractchain
