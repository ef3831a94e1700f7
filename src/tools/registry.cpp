// src/tools/registry.cpp
#include "abstractchain/tools/registry.h"
#include <algorithm>
#include <stdexcept>

namespace abstractchain {

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

ToolResult ToolRegistry::call_tool(const std::string& name, const std::vector<Value>& args) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return {false, nullptr, "Tool not found: " + name};
    }

    try {
        return {true, it->second(args), ""};
    } catch (const std::exception& e) {
        return {false, nullptr, std::string("Tool execution failed: ") + e.what()};
    } catch (...) {
        // tools run on worker threads; anything escaping here would terminate
        return {false, nullptr, "Tool execution failed: unknown exception"};
    }
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<ToolSpec> ToolRegistry::specs() const {
    std::vector<ToolSpec> out;
    out.reserve(specs_.size());
    for (const auto& name : list_tools()) {
        out.push_back(specs_.at(name));
    }
    return out;
}

Value ToolRegistry::specs_context() const {
    Value arr = Value::array();
    for (const auto& spec : specs()) {
        arr.push_back({
            {"name", spec.name},
            {"signature", spec.signature},
            {"description", spec.description}
        });
    }
    return arr;
}

namespace {

void require_two_numbers(const std::string& tool, const std::vector<Value>& args) {
    if (args.size() != 2 || !args[0].is_number() || !args[1].is_number()) {
        throw std::invalid_argument(tool + " expects two numeric arguments");
    }
}

bool both_integers(const std::vector<Value>& args) {
    return args[0].is_number_integer() && args[1].is_number_integer();
}

// Applies a checked builtin (__builtin_add_overflow etc.) to two int64 operands
template<typename Op>
Value checked_int64(const std::string& tool, const std::vector<Value>& args, Op op) {
    int64_t out = 0;
    if (op(args[0].get<int64_t>(), args[1].get<int64_t>(), &out)) {
        throw std::overflow_error(tool + " overflows a 64-bit integer");
    }
    return out;
}

} // namespace

void register_math_tools(ToolRegistry& registry) {
    registry.register_tool("add", [](const std::vector<Value>& args) -> Value {
        require_two_numbers("add", args);
        if (both_integers(args)) {
            return checked_int64("add", args, [](int64_t a, int64_t b, int64_t* out) {
                return __builtin_add_overflow(a, b, out);
            });
        }
        return args[0].get<double>() + args[1].get<double>();
    }, {"add", "add(a: number, b: number) -> number", "Add two numbers."});

    registry.register_tool("subtract", [](const std::vector<Value>& args) -> Value {
        require_two_numbers("subtract", args);
        if (both_integers(args)) {
            return checked_int64("subtract", args, [](int64_t a, int64_t b, int64_t* out) {
                return __builtin_sub_overflow(a, b, out);
            });
        }
        return args[0].get<double>() - args[1].get<double>();
    }, {"subtract", "subtract(a: number, b: number) -> number", "Subtract b from a."});

    registry.register_tool("multiply", [](const std::vector<Value>& args) -> Value {
        require_two_numbers("multiply", args);
        if (both_integers(args)) {
            return checked_int64("multiply", args, [](int64_t a, int64_t b, int64_t* out) {
                return __builtin_mul_overflow(a, b, out);
            });
        }
        return args[0].get<double>() * args[1].get<double>();
    }, {"multiply", "multiply(a: number, b: number) -> number", "Multiply two numbers."});

    registry.register_tool("divide", [](const std::vector<Value>& args) -> Value {
        require_two_numbers("divide", args);
        double b = args[1].get<double>();
        if (b == 0.0) {
            throw std::domain_error("Division by zero");
        }
        return args[0].get<double>() / b;
    }, {"divide", "divide(a: number, b: number) -> number", "Divide a by b."});
}

} // namespace abstractchain
