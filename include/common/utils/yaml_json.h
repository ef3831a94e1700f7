#ifndef ABSTRACTCHAIN_COMMON_UTILS_YAML_JSON_H
#define ABSTRACTCHAIN_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace abstractchain {

// 将 YAML::Node 转换为 nlohmann::json
// Plain scalars are coerced (null, bool, int, float); quoted scalars stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace abstractchain

#endif // ABSTRACTCHAIN_COMMON_UTILS_YAML_JSON_H
