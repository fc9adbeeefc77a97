// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/config/engine_config.h"
#include "common/utils/yaml_json.h"

#include <filesystem>
#include <fstream>

using namespace agentgraph;

TEST_CASE("Empty configuration keeps the defaults", "[config]") {
    auto config = load_engine_config_string("");
    REQUIRE(config.execution.max_steps == 100);
    REQUIRE_FALSE(config.execution.timeout.has_value());
    REQUIRE(config.supervisor.default_strategy == LoadBalancingStrategy::CAPABILITY_BASED);
    REQUIRE(config.supervisor.task_id_prefix == "task");
    REQUIRE(config.checkpoints.max_checkpoints == 0);
    REQUIRE(config.logging.level == "info");
}

TEST_CASE("All sections are read from YAML", "[config]") {
    auto config = load_engine_config_string(R"(
execution:
  max_steps: 25
  timeout_ms: 1500
  enable_checkpoints: true
  checkpoint_id: nightly
supervisor:
  default_strategy: priority_based
  task_id_prefix: job
checkpoints:
  max_checkpoints: 10
logging:
  level: debug
  pattern: "%v"
unrelated:
  ignored: yes
)");

    REQUIRE(config.execution.max_steps == 25);
    REQUIRE(config.execution.timeout == std::chrono::milliseconds(1500));
    REQUIRE(config.execution.enable_checkpoints);
    REQUIRE(config.execution.checkpoint_id == "nightly");
    REQUIRE(config.supervisor.default_strategy == LoadBalancingStrategy::PRIORITY_BASED);
    REQUIRE(config.supervisor.task_id_prefix == "job");
    REQUIRE(config.checkpoints.max_checkpoints == 10);
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.pattern == "%v");
}

TEST_CASE("Invalid values are rejected with ConfigError", "[config]") {
    REQUIRE_THROWS_AS(load_engine_config_string("execution: { max_steps: 0 }"), ConfigError);
    REQUIRE_THROWS_AS(load_engine_config_string("execution: { max_steps: many }"), ConfigError);
    REQUIRE_THROWS_AS(load_engine_config_string("execution: { timeout_ms: -5 }"), ConfigError);
    REQUIRE_THROWS_AS(load_engine_config_string("execution: [1, 2]"), ConfigError);
    REQUIRE_THROWS_AS(load_engine_config_string("supervisor: { default_strategy: fastest }"), ConfigError);
    REQUIRE_THROWS_AS(load_engine_config_string("execution: { enable_checkpoints: sometimes }"), ConfigError);
    REQUIRE_THROWS_AS(load_engine_config_string("- just\n- a list\n"), ConfigError);
    REQUIRE_THROWS_AS(load_engine_config_string("execution: { max_steps: ["), ConfigError);
}

TEST_CASE("Configuration loads from a file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "agentgraph_test_config.yaml";
    {
        std::ofstream out(path);
        out << "execution:\n  max_steps: 7\n";
    }
    auto config = load_engine_config_file(path.string());
    REQUIRE(config.execution.max_steps == 7);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(load_engine_config_file("/nonexistent/agentgraph.yaml"), ConfigError);
}

TEST_CASE("YAML scalars convert to typed JSON", "[config][yaml]") {
    auto j = yaml_to_json(YAML::Load(R"(
int: 42
neg: -3
float: 2.5
yes_bool: true
nothing: ~
quoted: "42"
text: hello
list: [1, two]
)"));
    REQUIRE(j["int"] == 42);
    REQUIRE(j["neg"] == -3);
    REQUIRE(j["float"] == 2.5);
    REQUIRE(j["yes_bool"] == true);
    REQUIRE(j["nothing"].is_null());
    REQUIRE(j["quoted"] == "42");
    REQUIRE(j["text"] == "hello");
    REQUIRE(j["list"][1] == "two");
}
