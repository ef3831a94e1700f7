// abstractchain/rewriter/plan_rewriter.h
#ifndef ABSTRACTCHAIN_REWRITER_PLAN_REWRITER_H
#define ABSTRACTCHAIN_REWRITER_PLAN_REWRITER_H

#include "abstractchain/graph/execution_plan.h"
#include "abstractchain/core/errors.h"
#include <string>

namespace abstractchain {

class PlanRewriter {
public:
    // Replaces every recognised marker of `plan` with the rendering of its
    // result in one left-to-right pass over the original text. Inert markers
    // (not in plan.calls()) are copied unchanged.
    // Throws RewriteError if a marker's node is missing, failed or not executed,
    // or if the recorded spans overlap.
    static std::string rewrite(const ExecutionPlan& plan);
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_REWRITER_PLAN_REWRITER_H
