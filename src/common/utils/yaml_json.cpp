// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include "common/utils.h"
#include <stdexcept>
#include <string>

namespace abstractchain {

namespace {

nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();

    // "!" is the tag yaml-cpp gives to quoted scalars
    if (node.Tag() == "!") return s;

    if (s == "true" || s == "True")  return true;
    if (s == "false" || s == "False") return false;
    if (s == "~" || s == "null" || s.empty()) return nullptr;

    try {
        if (is_integer(s)) {
            return std::stoll(s);
        }
        if (is_float(s)) {
            return std::stod(s);
        }
    } catch (const std::out_of_range&) {
        // out of range numbers are kept verbatim
    }
    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

} // namespace abstractchain
