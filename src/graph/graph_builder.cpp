// src/graph/graph_builder.cpp
#include "abstractchain/graph/graph_builder.h"
#include <algorithm>

namespace abstractchain {

ExecutionPlan GraphBuilder::build(std::string text, std::vector<CallExpression> calls) {
    ExecutionPlan plan(std::move(text), std::move(calls));

    // 1. 注册节点，拒绝重复占位符
    plan.nodes_.reserve(plan.calls_.size());
    for (size_t i = 0; i < plan.calls_.size(); ++i) {
        const auto& call = plan.calls_[i];
        if (plan.index_.count(call.output_placeholder) > 0) {
            throw GraphError(PlanErrorCode::DUPLICATE_PLACEHOLDER,
                             "Duplicate placeholder '" + call.output_placeholder + "' is defined by more than one call",
                             {call.output_placeholder});
        }
        DependencyNode node;
        node.id = call.output_placeholder;
        node.function_name = call.function_name;
        node.arguments = call.arguments;
        node.call_index = i;
        for (const auto& arg : call.arguments) {
            if (arg.is_reference()) {
                node.dependencies.insert(arg.reference);
            }
        }
        plan.index_.emplace(node.id, plan.nodes_.size());
        plan.nodes_.push_back(std::move(node));
    }

    // 2. 解析引用，建立反向边
    plan.dependents_.assign(plan.nodes_.size(), {});
    for (size_t i = 0; i < plan.nodes_.size(); ++i) {
        const auto& node = plan.nodes_[i];
        for (const auto& dep : node.dependencies) {
            auto it = plan.index_.find(dep);
            if (it == plan.index_.end()) {
                throw GraphError(PlanErrorCode::UNKNOWN_REFERENCE,
                                 "Unknown reference '" + dep + "' in call to " + node.function_name +
                                     " (= " + node.id + "): no call defines it",
                                 {dep});
            }
            plan.dependents_[it->second].push_back(i);
        }
    }

    // 3. 环检测
    check_acyclic(plan);
    return plan;
}

void GraphBuilder::check_acyclic(const ExecutionPlan& plan) {
    enum class Mark : uint8_t { UNVISITED, ON_PATH, FINISHED };

    // Explicit DFS stack; the frames double as the current path
    struct Frame {
        size_t index;
        std::set<Placeholder>::const_iterator next_dep;
    };

    std::vector<Mark> marks(plan.nodes_.size(), Mark::UNVISITED);
    std::vector<Frame> stack;

    auto push = [&](size_t index) {
        marks[index] = Mark::ON_PATH;
        stack.push_back({index, plan.nodes_[index].dependencies.begin()});
    };

    for (size_t root = 0; root < plan.nodes_.size(); ++root) {
        if (marks[root] != Mark::UNVISITED) continue;
        push(root);

        while (!stack.empty()) {
            Frame& top = stack.back();
            if (top.next_dep == plan.nodes_[top.index].dependencies.end()) {
                marks[top.index] = Mark::FINISHED;
                stack.pop_back();
                continue;
            }
            size_t next = plan.index_.at(*top.next_dep);
            ++top.next_dep;

            if (marks[next] == Mark::ON_PATH) {
                auto start = std::find_if(stack.begin(), stack.end(),
                                          [next](const Frame& f) { return f.index == next; });
                std::vector<Placeholder> cycle;
                std::string description;
                for (auto it = start; it != stack.end(); ++it) {
                    cycle.push_back(plan.nodes_[it->index].id);
                    description += plan.nodes_[it->index].id + " -> ";
                }
                description += plan.nodes_[next].id;
                throw GraphError(PlanErrorCode::CYCLE_DETECTED,
                                 "Dependency cycle detected: " + description, std::move(cycle));
            }
            if (marks[next] == Mark::UNVISITED) {
                push(next);
            }
        }
    }
}

} // namespace abstractchain
