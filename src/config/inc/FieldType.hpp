#pragma once

#include <string>
#include <vector>

enum class FieldType {
    UNKNOWN,
    INT,
    STRING,
    TIME,
    BOOL,
    DURATION
};

// Case-insensitive, returns FieldType::UNKNOWN for unrecognized names
FieldType parse_field_type(const std::string& name);

const char* field_type_name(FieldType type);

bool is_known_field_type(const std::string& name);

const std::vector<std::string>& known_field_types();

struct FieldSpecEntry {
    std::string name;
    FieldType type = FieldType::UNKNOWN;
};

// Ordered as configured
using FieldSpec = std::vector<FieldSpecEntry>;
