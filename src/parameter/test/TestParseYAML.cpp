#include "ParameterContext.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <yaml-cpp/yaml.h>


int main() {
    // Open YAML file
    std::cout << "Opening config: " << CONFIG_PATH << std::endl;
    std::ifstream file(CONFIG_PATH);
    if (!file.is_open()) {
        std::cerr << "Failed to open " << CONFIG_PATH << std::endl;
        return 1;
    }

    // Parse YAML file
    YAML::Node config;
    try {
        config = YAML::Load(file);
    } catch (const YAML::ParserException& e) {
        std::cerr << "YAML parse error: " << e.what() << std::endl;
        return 1;
    }

    // The shipped example must decode and validate
    ParameterContext ctx;
    ctx.merge_yaml(config);
    const auto& source = ctx.get_source_config();
    source.validate();

    assert(source.record_count == 1000);
    assert(source.rate == 200);
    assert(source.collections.size() == 3);
    assert(source.collection_configs().size() == 3);
    assert(source.collections.at("users").format.schema_subject == "payload");
    assert(ctx.get_global_config().output == "-");

    std::cout << "test_parse_yaml passed\n";

    return 0;
}
