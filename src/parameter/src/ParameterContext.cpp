#include "ParameterContext.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path", true},
    {"--record-count", 'n', "Number of records to generate, 0 means unlimited", true},
    {"--rate", 'r', "Maximum records per second, 0 means unlimited", true},
    {"--output", 'o', "Write JSON lines to this file, - means stdout", true},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: syngen [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  SYNGEN_RECORD_COUNT, SYNGEN_RATE override the config file\n"
              << "\nExamples:\n"
              << "  syngen --config-file=syngen.yaml\n"
              << "  syngen -c syngen.yaml -n 1000 -r 200 -o records.jsonl\n\n";
}

void ParameterContext::show_version() {
    std::cout << "syngen version: " << SYNGEN_VERSION << std::endl;
    std::cout << "git: " << SYNGEN_BUILD_GIT << std::endl;
    std::cout << "build: " << SYNGEN_BUILD_TARGET_OSTYPE << "-" << SYNGEN_BUILD_TARGET_CPUTYPE << " " << SYNGEN_BUILD_DATE << std::endl;
}

int64_t ParameterContext::parse_record_count(const std::string& value, const std::string& origin) {
    size_t consumed = 0;
    int64_t count = 0;
    try {
        count = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid record count from " + origin + ": " + value);
    }
    if (consumed != value.size()) {
        throw std::runtime_error("Invalid record count from " + origin + ": " + value);
    }
    return count;
}

double ParameterContext::parse_rate(const std::string& value, const std::string& origin) {
    size_t consumed = 0;
    double rate = 0;
    try {
        rate = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid rate from " + origin + ": " + value);
    }
    if (consumed != value.size()) {
        throw std::runtime_error("Invalid rate from " + origin + ": " + value);
    }
    return rate;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }

    static const std::set<std::string> global_keys = {"log", "output", "verbose"};
    static const std::set<std::string> source_keys = {
        "record_count", "rate", "read_time", "burst", "operations", "format", "collections"
    };
    YAML::check_unknown_keys(config, YAML::merge_keys({global_keys, source_keys}), "config");

    // Split the document into global and source settings
    YAML::Node global_node(YAML::NodeType::Map);
    YAML::Node source_node(YAML::NodeType::Map);
    for (auto it = config.begin(); it != config.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        if (global_keys.count(key)) {
            global_node[key] = it->second;
        } else {
            source_node[key] = it->second;
        }
    }

    config_data.global = global_node.as<GlobalConfig>();
    config_data.source = source_node.as<SourceConfig>();
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (!cli_params.count("--config-file")) {
        throw std::runtime_error("Missing required parameter: --config-file or -c");
    }
    merge_yaml(cli_params["--config-file"]);
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value && pos == std::string::npos) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& source = config_data.source;
    auto& global = config_data.global;

    if (cli_params.count("--record-count")) {
        source.record_count = parse_record_count(cli_params["--record-count"], "--record-count");
    }
    if (cli_params.count("--rate")) {
        source.rate = parse_rate(cli_params["--rate"], "--rate");
    }
    if (cli_params.count("--output")) {
        global.output = cli_params["--output"];
    }
    if (cli_params.count("--verbose")) {
        global.verbose = true;
    }
}

void ParameterContext::merge_environment_vars() {
    auto& source = config_data.source;

    if (const char* env_value = std::getenv("SYNGEN_RECORD_COUNT")) {
        source.record_count = parse_record_count(env_value, "SYNGEN_RECORD_COUNT");
    }
    if (const char* env_value = std::getenv("SYNGEN_RATE")) {
        source.rate = parse_rate(env_value, "SYNGEN_RATE");
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}

const SourceConfig& ParameterContext::get_source_config() const {
    return config_data.source;
}
