#include <iostream>
#include <cassert>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "ConfigParser.hpp"

using namespace std::chrono;

void test_BurstConfig() {
    YAML::Node node = YAML::Load(R"(
sleep_time: 100ms
generate_time: 1m30s
)");
    BurstConfig burst = node.as<BurstConfig>();
    assert(burst.sleep_time == milliseconds(100));
    assert(burst.generate_time == seconds(90));

    BurstConfig defaults = YAML::Load("{}").as<BurstConfig>();
    assert(defaults.sleep_time.count() == 0);
    assert(defaults.generate_time == seconds(1));
    std::cout << "test_BurstConfig passed" << std::endl;
}

void test_BurstConfig_invalid_duration() {
    try {
        YAML::Load("sleep_time: 10 parsecs").as<BurstConfig>();
        assert(false && "Should throw on invalid duration");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        assert(msg.find("burst::sleep_time") != std::string::npos);
    }
    std::cout << "test_BurstConfig_invalid_duration passed" << std::endl;
}

void test_FormatConfig_keeps_field_order() {
    YAML::Node node = YAML::Load(R"(
type: structured
options:
  zeta: int
  alpha: string
  mid: time
schema_subject: payload
)");
    FormatConfig format = node.as<FormatConfig>();
    assert(format.type == "structured");
    assert(format.schema_subject == "payload");
    assert(format.options.size() == 3);
    assert(format.options[0].first == "zeta" && format.options[0].second == "int");
    assert(format.options[1].first == "alpha");
    assert(format.options[2].first == "mid" && format.options[2].second == "time");
    std::cout << "test_FormatConfig_keeps_field_order passed" << std::endl;
}

void test_FormatConfig_file() {
    FormatConfig format = YAML::Load(R"(
type: file
path: /tmp/payload.bin
)").as<FormatConfig>();
    assert(format.payload_format() == PayloadFormat::File);
    assert(format.path == "/tmp/payload.bin");
    assert(format.options.empty());
    std::cout << "test_FormatConfig_file passed" << std::endl;
}

void test_CollectionConfig_operations() {
    CollectionConfig seq = YAML::Load(R"(
operations: [create, update]
format:
  type: raw
  options: {id: int}
)").as<CollectionConfig>();
    assert(seq.operations.size() == 2);
    assert(seq.operations[1] == "update");

    CollectionConfig csv = YAML::Load(R"(
operations: "create, delete ,snapshot"
format: {type: raw}
)").as<CollectionConfig>();
    assert(csv.operations.size() == 3);
    assert(csv.operations[1] == "delete");
    assert(csv.operations[2] == "snapshot");

    CollectionConfig defaults = YAML::Load("format: {type: raw}").as<CollectionConfig>();
    assert(defaults.operations.size() == 1 && defaults.operations[0] == "create");
    std::cout << "test_CollectionConfig_operations passed" << std::endl;
}

void test_SourceConfig() {
    YAML::Node node = YAML::Load(R"(
record_count: 100
rate: 12.5
burst:
  sleep_time: 2s
  generate_time: 500ms
format:
  type: raw
  options:
    id: int
collections:
  users:
    operations: [create]
    format:
      type: structured
      options: {name: string}
  orders:
    format:
      type: file
      path: orders.json
)");
    SourceConfig source = node.as<SourceConfig>();
    assert(source.record_count == 100);
    assert(source.rate == 12.5);
    assert(source.burst.sleep_time == seconds(2));
    assert(source.burst.generate_time == milliseconds(500));
    assert(source.default_collection.format.type == "raw");
    assert(source.collections.size() == 2);
    assert(source.collections.at("orders").format.path == "orders.json");

    auto configs = source.collection_configs();
    assert(configs.size() == 3);
    assert(configs[0].first.empty());
    assert(configs[1].first == "orders");
    assert(configs[2].first == "users");

    source.validate();
    std::cout << "test_SourceConfig passed" << std::endl;
}

void test_SourceConfig_read_time() {
    SourceConfig source = YAML::Load(R"(
read_time: 250ms
format: {type: raw, options: {id: int}}
)").as<SourceConfig>();
    assert(source.read_time == milliseconds(250));
    assert(source.rate_limit() > 3.999 && source.rate_limit() < 4.001);
    std::cout << "test_SourceConfig_read_time passed" << std::endl;
}

void test_unknown_keys() {
    try {
        YAML::Load("rate: 1\nspeed: 2").as<SourceConfig>();
        assert(false && "Should throw on unknown key");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        assert(msg.find("Unknown configuration key in source: speed") != std::string::npos);
    }

    try {
        YAML::Load(R"(
collections:
  users:
    format: {type: raw, encoding: utf8}
)").as<SourceConfig>();
        assert(false && "Should throw on unknown nested key");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        assert(msg.find("\"users\"") != std::string::npos);
        assert(msg.find("Unknown configuration key in format: encoding") != std::string::npos);
    }
    std::cout << "test_unknown_keys passed" << std::endl;
}

void test_GlobalConfig() {
    GlobalConfig global = YAML::Load(R"(
log:
  level: debug
  file: /tmp/syngen/syngen.log
output: out.jsonl
)").as<GlobalConfig>();
    assert(global.log_level == "debug");
    assert(global.log_file == "/tmp/syngen/syngen.log");
    assert(global.output == "out.jsonl");
    assert(!global.verbose);
    std::cout << "test_GlobalConfig passed" << std::endl;
}

int main() {
    test_BurstConfig();
    test_BurstConfig_invalid_duration();
    test_FormatConfig_keeps_field_order();
    test_FormatConfig_file();
    test_CollectionConfig_operations();
    test_SourceConfig();
    test_SourceConfig_read_time();
    test_unknown_keys();
    test_GlobalConfig();

    std::cout << "All ConfigParser tests passed!" << std::endl;
    return 0;
}
