// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "abstractchain/core/config.h"
#include "common/utils/yaml_json.h"
#include <stdexcept>

using namespace abstractchain;

TEST_CASE("YAML scalars are converted to JSON types", "[config]") {
    auto j = yaml_to_json(YAML::Load(R"(
count: 3
ratio: 0.25
enabled: true
missing: ~
quoted: "42"
name: plain
list: [1, two]
)"));
    REQUIRE(j["count"] == 3);
    REQUIRE(j["ratio"] == 0.25);
    REQUIRE(j["enabled"] == true);
    REQUIRE(j["missing"].is_null());
    REQUIRE(j["quoted"] == "42");
    REQUIRE(j["name"] == "plain");
    REQUIRE(j["list"] == nlohmann::json::array({1, "two"}));
}

TEST_CASE("Engine config is read from YAML", "[config]") {
    auto config = parse_engine_config(R"(
verbose: true
executor:
  max_concurrency: 2
prompts:
  reasoning: "Q: {{ question }}"
llm:
  model_path: models/tiny.gguf
  n_ctx: 4096
)", "/etc/abstractchain");

    REQUIRE(config.verbose);
    REQUIRE(config.executor.verbose);
    REQUIRE(config.executor.max_concurrency == 2);
    REQUIRE(config.reasoning_template == "Q: {{ question }}");
    REQUIRE(config.refine_template.empty());
    REQUIRE(config.llm["model_path"] == "models/tiny.gguf");
    REQUIRE(config.llm["n_ctx"] == 4096);
    REQUIRE(config.base_dir == "/etc/abstractchain");
}

TEST_CASE("Empty config keeps defaults", "[config]") {
    auto config = parse_engine_config("");
    REQUIRE_FALSE(config.verbose);
    REQUIRE(config.executor.max_concurrency == 4);
    REQUIRE(config.llm.is_null());
}

TEST_CASE("Invalid config is rejected", "[config]") {
    REQUIRE_THROWS_AS(parse_engine_config("verbose: [unclosed"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_engine_config("- a\n- b\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_engine_config("verbose: sometimes"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_engine_config("executor:\n  max_concurrency: -1\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_engine_config("executor: 3"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_engine_config("prompts:\n  refine: [1]\n"), std::runtime_error);
    REQUIRE_THROWS_AS(load_engine_config("/nonexistent/abstractchain.yaml"), std::runtime_error);
}
