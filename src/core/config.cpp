// src/core/config.cpp
#include "abstractchain/core/config.h"
#include "common/utils/yaml_json.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace abstractchain {

namespace {

const nlohmann::json* find_key(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &*it;
}

const nlohmann::json* find_section(const nlohmann::json& root, const char* key) {
    const auto* section = find_key(root, key);
    if (section == nullptr || section->is_null()) return nullptr;
    if (!section->is_object()) {
        throw std::runtime_error(std::string("'") + key + "' must be a mapping");
    }
    return section;
}

} // namespace

EngineConfig parse_engine_config(const std::string& yaml_text, const std::string& base_dir) {
    nlohmann::json root;
    try {
        root = yaml_to_json(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid engine config: " + std::string(e.what()));
    }
    if (!root.is_null() && !root.is_object()) {
        throw std::runtime_error("Engine config must be a mapping");
    }

    EngineConfig config;
    config.base_dir = base_dir;

    if (const auto* verbose = find_key(root, "verbose")) {
        if (!verbose->is_boolean()) {
            throw std::runtime_error("'verbose' must be a boolean");
        }
        config.verbose = verbose->get<bool>();
    }

    if (const auto* executor = find_section(root, "executor")) {
        if (const auto* limit = find_key(*executor, "max_concurrency")) {
            if (!limit->is_number_integer() || limit->get<int64_t>() < 0) {
                throw std::runtime_error("'executor.max_concurrency' must be a non-negative integer");
            }
            config.executor.max_concurrency = limit->get<size_t>();
        }
    }
    config.executor.verbose = config.verbose;

    if (const auto* prompts = find_section(root, "prompts")) {
        auto read_template = [prompts](const char* key, std::string& out) {
            if (const auto* tmpl = find_key(*prompts, key)) {
                if (!tmpl->is_string()) {
                    throw std::runtime_error(std::string("'prompts.") + key + "' must be a string");
                }
                out = tmpl->get<std::string>();
            }
        };
        read_template("reasoning", config.reasoning_template);
        read_template("refine", config.refine_template);
    }

    if (const auto* llm = find_section(root, "llm")) {
        config.llm = *llm;
    }

    return config;
}

EngineConfig load_engine_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string base_dir = std::filesystem::path(path).parent_path().string();
    if (base_dir.empty()) base_dir = ".";
    return parse_engine_config(buffer.str(), base_dir);
}

} // namespace abstractchain
