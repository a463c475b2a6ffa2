#include "CollectionConfig.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

PayloadFormat parse_payload_format(const std::string& name) {
    const std::string lower = StringUtils::to_lower(StringUtils::trimmed(name));
    if (lower == "raw")        return PayloadFormat::Raw;
    if (lower == "structured") return PayloadFormat::Structured;
    if (lower == "file")       return PayloadFormat::File;
    return PayloadFormat::Unknown;
}

FieldSpec FormatConfig::field_spec() const {
    FieldSpec spec;
    spec.reserve(options.size());
    for (const auto& [name, type] : options) {
        spec.push_back(FieldSpecEntry{StringUtils::trimmed(name), parse_field_type(type)});
    }
    return spec;
}

std::vector<std::string> FormatConfig::validate() const {
    std::vector<std::string> errors;

    switch (payload_format()) {
        case PayloadFormat::File:
            if (StringUtils::trimmed(path).empty()) {
                errors.push_back("file path not specified");
            }
            break;
        case PayloadFormat::Raw:
        case PayloadFormat::Structured:
            for (const auto& [name, type] : options) {
                if (StringUtils::trimmed(name).empty()) {
                    errors.push_back("got empty field name in \"" + name + "\"");
                }
                if (StringUtils::trimmed(type).empty()) {
                    errors.push_back("got empty type in \"" + name + "\"");
                } else if (!is_known_field_type(type)) {
                    errors.push_back("unknown data type \"" + type + "\" in \"" + name + "\", allowed values are "
                                     + StringUtils::join(known_field_types(), ", "));
                }
            }
            break;
        default:
            errors.push_back("unknown format type \"" + type + "\"");
            break;
    }

    if (!schema_subject.empty() && payload_format() != PayloadFormat::Structured) {
        errors.push_back("schema_subject is only supported with the structured format");
    }

    return errors;
}

std::vector<std::string> CollectionConfig::validate() const {
    std::vector<std::string> errors;

    if (operations.empty()) {
        errors.push_back("at least one operation is required");
    }
    for (const auto& op : operations) {
        try {
            parse_operation(op);
        } catch (const std::invalid_argument& e) {
            errors.push_back(std::string("failed parsing operation: ") + e.what());
        }
    }

    for (const auto& err : format.validate()) {
        errors.push_back("failed validating format: " + err);
    }

    return errors;
}
