// abstractchain/graph/execution_plan.h
#ifndef ABSTRACTCHAIN_GRAPH_EXECUTION_PLAN_H
#define ABSTRACTCHAIN_GRAPH_EXECUTION_PLAN_H

#include "common/types.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace abstractchain {

class GraphBuilder;

// The DAG for one model-generated plan. Nodes live in an arena indexed by
// placeholder id; `dependents` is the reverse adjacency used by the executor.
// Owned by exactly one run and never reused.
class ExecutionPlan {
public:
    ExecutionPlan(ExecutionPlan&&) = default;
    ExecutionPlan& operator=(ExecutionPlan&&) = default;
    ExecutionPlan(const ExecutionPlan&) = delete;
    ExecutionPlan& operator=(const ExecutionPlan&) = delete;

    const std::string& text() const { return text_; }
    const std::vector<CallExpression>& calls() const { return calls_; }

    std::vector<DependencyNode>& nodes() { return nodes_; }
    const std::vector<DependencyNode>& nodes() const { return nodes_; }

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    DependencyNode* find(const Placeholder& id);
    const DependencyNode* find(const Placeholder& id) const;

    // Throws std::out_of_range for an unknown id
    DependencyNode& node(const Placeholder& id);
    const DependencyNode& node(const Placeholder& id) const;

    size_t index_of(const Placeholder& id) const;
    const std::vector<size_t>& dependents(size_t index) const { return dependents_.at(index); }

    // placeholder -> result for every node that reached DONE
    Value results() const;

private:
    friend class GraphBuilder;

    ExecutionPlan(std::string text, std::vector<CallExpression> calls)
        : text_(std::move(text)), calls_(std::move(calls)) {}

    std::string text_;
    std::vector<CallExpression> calls_;
    std::vector<DependencyNode> nodes_;
    std::unordered_map<Placeholder, size_t> index_;
    std::vector<std::vector<size_t>> dependents_;
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_GRAPH_EXECUTION_PLAN_H
