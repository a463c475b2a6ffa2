#pragma once

#include "ConfigData.hpp"
#include "DurationUtils.hpp"
#include "StringUtils.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>


namespace YAML {

    template<typename T>
    std::set<T> merge_keys(const std::initializer_list<std::set<T>>& sets) {
        std::set<T> result;
        for (const auto& s : sets) {
            result.insert(s.begin(), s.end());
        }
        return result;
    }

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        if (!node.IsMap()) {
            throw std::runtime_error("Expected a mapping for " + context);
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    // Durations are strings such as "500ms" or "1m30s"
    inline std::chrono::nanoseconds parse_duration(const YAML::Node& node, const std::string& context) {
        const std::string text = node.as<std::string>();
        try {
            return DurationUtils::parse(text);
        } catch (const std::exception& e) {
            throw std::runtime_error("Invalid duration for " + context + ": " + e.what());
        }
    }

    // Accepts a sequence or a comma separated string
    inline std::vector<std::string> parse_operations(const YAML::Node& node) {
        if (node.IsSequence()) {
            return node.as<std::vector<std::string>>();
        }
        return StringUtils::split(node.as<std::string>(), ',');
    }

    template<>
    struct convert<BurstConfig> {
        static bool decode(const Node& node, BurstConfig& rhs) {
            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {"sleep_time", "generate_time"};
            check_unknown_keys(node, valid_keys, "burst");

            if (node["sleep_time"]) {
                rhs.sleep_time = parse_duration(node["sleep_time"], "burst::sleep_time");
            }
            if (node["generate_time"]) {
                rhs.generate_time = parse_duration(node["generate_time"], "burst::generate_time");
            }
            return true;
        }
    };

    template<>
    struct convert<FormatConfig> {
        static bool decode(const Node& node, FormatConfig& rhs) {
            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {"type", "options", "path", "schema_subject"};
            check_unknown_keys(node, valid_keys, "format");

            if (node["type"]) {
                rhs.type = node["type"].as<std::string>();
            }
            if (node["options"]) {
                const auto& options = node["options"];
                if (!options.IsMap()) {
                    throw std::runtime_error("format::options must map field names to types");
                }

                // Keep the configured field order
                rhs.options.clear();
                for (auto it = options.begin(); it != options.end(); ++it) {
                    rhs.options.emplace_back(it->first.as<std::string>(), it->second.as<std::string>());
                }
            }
            if (node["path"]) {
                rhs.path = node["path"].as<std::string>();
            }
            if (node["schema_subject"]) {
                rhs.schema_subject = node["schema_subject"].as<std::string>();
            }
            return true;
        }
    };

    template<>
    struct convert<CollectionConfig> {
        static bool decode(const Node& node, CollectionConfig& rhs) {
            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {"operations", "format"};
            check_unknown_keys(node, valid_keys, "collection");

            if (node["operations"]) {
                rhs.operations = parse_operations(node["operations"]);
            }
            if (node["format"]) {
                rhs.format = node["format"].as<FormatConfig>();
            }
            return true;
        }
    };

    template<>
    struct convert<SourceConfig> {
        static bool decode(const Node& node, SourceConfig& rhs) {
            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {
                "record_count", "rate", "read_time", "burst", "operations", "format", "collections"
            };
            check_unknown_keys(node, valid_keys, "source");

            if (node["record_count"]) {
                rhs.record_count = node["record_count"].as<int64_t>();
            }
            if (node["rate"]) {
                rhs.rate = node["rate"].as<double>();
            }
            if (node["read_time"]) {
                rhs.read_time = parse_duration(node["read_time"], "read_time");
            }
            if (node["burst"]) {
                rhs.burst = node["burst"].as<BurstConfig>();
            }

            // Default collection
            if (node["operations"]) {
                rhs.default_collection.operations = parse_operations(node["operations"]);
            }
            if (node["format"]) {
                rhs.default_collection.format = node["format"].as<FormatConfig>();
            }

            if (node["collections"]) {
                const auto& collections = node["collections"];
                if (!collections.IsMap()) {
                    throw std::runtime_error("collections must map collection names to their configuration");
                }
                for (auto it = collections.begin(); it != collections.end(); ++it) {
                    const std::string name = it->first.as<std::string>();
                    if (StringUtils::trimmed(name).empty()) {
                        throw std::runtime_error("Collection names must not be empty");
                    }
                    try {
                        rhs.collections[name] = it->second.as<CollectionConfig>();
                    } catch (const std::exception& e) {
                        throw std::runtime_error("Invalid configuration for collection \"" + name + "\": " + e.what());
                    }
                }
            }
            return true;
        }
    };

    template<>
    struct convert<GlobalConfig> {
        static bool decode(const Node& node, GlobalConfig& rhs) {
            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {"log", "output", "verbose"};
            check_unknown_keys(node, valid_keys, "global");

            if (node["verbose"]) {
                rhs.verbose = node["verbose"].as<bool>();
            }
            if (node["output"]) {
                rhs.output = node["output"].as<std::string>();
            }
            if (node["log"]) {
                const auto& log_node = node["log"];

                static const std::set<std::string> log_keys = {"level", "file"};
                check_unknown_keys(log_node, log_keys, "log");

                if (log_node["level"]) rhs.log_level = log_node["level"].as<std::string>();
                if (log_node["file"]) rhs.log_file = log_node["file"].as<std::string>();
            }
            return true;
        }
    };

}
