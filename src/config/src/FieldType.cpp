#include "FieldType.hpp"
#include "StringUtils.hpp"

FieldType parse_field_type(const std::string& name) {
    const std::string lower = StringUtils::to_lower(StringUtils::trimmed(name));
    if (lower == "int")      return FieldType::INT;
    if (lower == "string")   return FieldType::STRING;
    if (lower == "time")     return FieldType::TIME;
    if (lower == "bool")     return FieldType::BOOL;
    if (lower == "duration") return FieldType::DURATION;
    return FieldType::UNKNOWN;
}

const char* field_type_name(FieldType type) {
    switch (type) {
        case FieldType::INT:      return "int";
        case FieldType::STRING:   return "string";
        case FieldType::TIME:     return "time";
        case FieldType::BOOL:     return "bool";
        case FieldType::DURATION: return "duration";
        default:                  return "unknown";
    }
}

bool is_known_field_type(const std::string& name) {
    return parse_field_type(name) != FieldType::UNKNOWN;
}

const std::vector<std::string>& known_field_types() {
    static const std::vector<std::string> types = {"int", "string", "time", "bool", "duration"};
    return types;
}
