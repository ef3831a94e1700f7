// abstractchain/graph/graph_builder.h
#ifndef ABSTRACTCHAIN_GRAPH_GRAPH_BUILDER_H
#define ABSTRACTCHAIN_GRAPH_GRAPH_BUILDER_H

#include "abstractchain/graph/execution_plan.h"
#include "abstractchain/core/errors.h"
#include <string>
#include <vector>

namespace abstractchain {

class GraphBuilder {
public:
    // Builds the dependency graph for `calls` (textual order).
    // Throws GraphError on a duplicate placeholder, an unknown reference or a
    // cycle. Dependencies come from argument references only.
    static ExecutionPlan build(std::string text, std::vector<CallExpression> calls);

private:
    static void check_acyclic(const ExecutionPlan& plan);
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_GRAPH_GRAPH_BUILDER_H
