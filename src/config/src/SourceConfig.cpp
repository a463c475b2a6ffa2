#include "SourceConfig.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

double SourceConfig::rate_limit() const {
    if (rate == 0.0 && read_time.count() > 0) {
        return 1.0 / std::chrono::duration<double>(read_time).count();
    }
    return rate;
}

std::vector<std::pair<std::string, CollectionConfig>> SourceConfig::collection_configs() const {
    std::vector<std::pair<std::string, CollectionConfig>> result;
    result.reserve(collections.size() + 1);
    if (!default_collection.format.type.empty()) {
        result.emplace_back("", default_collection);
    }
    for (const auto& [name, cfg] : collections) {
        result.emplace_back(name, cfg);
    }
    return result;
}

void SourceConfig::validate() const {
    std::vector<std::string> errors;

    if (read_time.count() > 0 && rate > 0) {
        errors.push_back("cannot specify both \"read_time\" and \"rate\", \"read_time\" is deprecated, please only specify \"rate\"");
    }
    if (read_time.count() < 0) {
        errors.push_back("\"read_time\" should be greater or equal to 0");
    }
    if (rate < 0) {
        errors.push_back("\"rate\" should be greater or equal to 0");
    }
    if (record_count < 0) {
        errors.push_back("\"record_count\" should be greater or equal to 0");
    }

    if (burst.sleep_time.count() < 0) {
        errors.push_back("\"burst.sleep_time\" should be greater or equal to 0");
    }
    if (burst.sleep_time.count() > 0 && burst.generate_time.count() <= 0) {
        errors.push_back("\"burst.generate_time\" should be greater than 0");
    }

    const auto configs = collection_configs();
    if (configs.empty()) {
        errors.push_back("invalid configuration, please configure at least one collection using \"format.type\" or \"collections.*.format.type\"");
    }
    for (const auto& [name, cfg] : configs) {
        for (const auto& err : cfg.validate()) {
            if (name.empty()) {
                errors.push_back("failed validating default collection: " + err);
            } else {
                errors.push_back("failed validating collection \"" + name + "\": " + err);
            }
        }
    }

    if (!errors.empty()) {
        throw std::invalid_argument(StringUtils::join(errors, "\n"));
    }
}
