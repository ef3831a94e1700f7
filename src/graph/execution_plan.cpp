// src/graph/execution_plan.cpp
#include "abstractchain/graph/execution_plan.h"
#include <stdexcept>

namespace abstractchain {

DependencyNode* ExecutionPlan::find(const Placeholder& id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

const DependencyNode* ExecutionPlan::find(const Placeholder& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

DependencyNode& ExecutionPlan::node(const Placeholder& id) {
    return nodes_[index_of(id)];
}

const DependencyNode& ExecutionPlan::node(const Placeholder& id) const {
    return nodes_[index_of(id)];
}

size_t ExecutionPlan::index_of(const Placeholder& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("No node for placeholder: " + id);
    }
    return it->second;
}

Value ExecutionPlan::results() const {
    Value out = Value::object();
    for (const auto& node : nodes_) {
        if (node.status == NodeStatus::DONE && node.result) {
            out[node.id] = *node.result;
        }
    }
    return out;
}

} // namespace abstractchain
