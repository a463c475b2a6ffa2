#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when only help or version output was requested
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;
    const SourceConfig& get_source_config() const;

private:
    ConfigData config_data; // Top-level config data

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;

    static int64_t parse_record_count(const std::string& value, const std::string& origin);
    static double parse_rate(const std::string& value, const std::string& origin);

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--rate")
        char short_opt;          // Short option (e.g. 'r')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
