#ifndef ABSTRACTCHAIN_COMMON_TYPES_H
#define ABSTRACTCHAIN_COMMON_TYPES_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace abstractchain {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using Context = nlohmann::json;

// 占位符，例如 "y1"
using Placeholder = std::string;

// Byte range of a `[FUNC ...]` marker inside the original plan text
struct SourceSpan {
    size_t begin = 0;
    size_t length = 0;

    size_t end() const { return begin + length; }
};

struct ArgumentToken {
    enum class Kind : uint8_t {
        LITERAL,
        REFERENCE
    };

    Kind kind = Kind::LITERAL;
    std::string raw;            // token text as written in the plan
    Value literal;              // set when kind == LITERAL
    Placeholder reference;      // set when kind == REFERENCE

    bool is_reference() const { return kind == Kind::REFERENCE; }
};

struct CallExpression {
    std::string function_name;
    std::vector<ArgumentToken> arguments;
    Placeholder output_placeholder;
    SourceSpan source_span;
};

enum class NodeStatus : uint8_t {
    PENDING,
    READY,
    RUNNING,
    DONE,
    FAILED
};

inline const char* to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::PENDING: return "pending";
        case NodeStatus::READY:   return "ready";
        case NodeStatus::RUNNING: return "running";
        case NodeStatus::DONE:    return "done";
        case NodeStatus::FAILED:  return "failed";
    }
    return "unknown";
}

struct DependencyNode {
    Placeholder id;
    std::string function_name;
    std::vector<ArgumentToken> arguments;
    std::set<Placeholder> dependencies;
    std::vector<Value> resolved_args;   // populated at dispatch
    std::optional<Value> result;
    NodeStatus status = NodeStatus::PENDING;
    std::string error;
    size_t call_index = 0;              // position in ExecutionPlan::calls()
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_COMMON_TYPES_H
