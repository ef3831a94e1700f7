// abstractchain/core/config.h
#ifndef ABSTRACTCHAIN_CORE_CONFIG_H
#define ABSTRACTCHAIN_CORE_CONFIG_H

#include "abstractchain/scheduler/plan_executor.h"
#include <nlohmann/json.hpp>
#include <string>

namespace abstractchain {

struct EngineConfig {
    PlanExecutor::Config executor;
    bool verbose = false;
    std::string reasoning_template;   // empty = built-in
    std::string refine_template;      // empty = built-in
    nlohmann::json llm;               // raw `llm` section, see LlamaAdapter::config_from_json
    std::string base_dir = ".";       // directory of the config file
};

// Throws std::runtime_error on invalid YAML or a key of the wrong type
EngineConfig parse_engine_config(const std::string& yaml_text, const std::string& base_dir = ".");
EngineConfig load_engine_config(const std::string& path);

} // namespace abstractchain

#endif // ABSTRACTCHAIN_CORE_CONFIG_H
