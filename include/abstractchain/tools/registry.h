// abstractchain/tools/registry.h
#ifndef ABSTRACTCHAIN_TOOLS_REGISTRY_H
#define ABSTRACTCHAIN_TOOLS_REGISTRY_H

#include "common/types.h"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace abstractchain {

// Tools receive the resolved arguments in call order and report failure by throwing
using ToolFunction = std::function<Value(const std::vector<Value>&)>;

struct ToolSpec {
    std::string name;
    std::string signature;   // rendered by the caller, e.g. "add(a: int, b: int) -> int"
    std::string description;
};

struct ToolResult {
    bool success = false;
    Value value;
    std::string error;
};

// Capability set for one run: name -> invoke. Registration happens before the
// run starts; call_tool may then be used from several worker threads at once,
// so the tool functions themselves must be thread-safe.
class ToolRegistry {
public:
    ToolRegistry() = default;

    template<typename Func>
    void register_tool(std::string name, Func&& func, ToolSpec spec = {}) {
        spec.name = name;
        if (spec.signature.empty()) {
            spec.signature = name + "(...)";
        }
        specs_[name] = std::move(spec);
        tools_[std::move(name)] = ToolFunction(std::forward<Func>(func));
    }

    bool has_tool(const std::string& name) const;
    ToolResult call_tool(const std::string& name, const std::vector<Value>& args) const;

    std::vector<std::string> list_tools() const;   // sorted
    std::vector<ToolSpec> specs() const;           // sorted by name

    // [{"name", "signature", "description"}, ...] for prompt templates
    Value specs_context() const;

private:
    std::unordered_map<std::string, ToolFunction> tools_;
    std::unordered_map<std::string, ToolSpec> specs_;
};

// add, subtract, multiply, divide over numeric arguments
void register_math_tools(ToolRegistry& registry);

} // namespace abstractchain

#endif // ABSTRACTCHAIN_TOOLS_REGISTRY_H
