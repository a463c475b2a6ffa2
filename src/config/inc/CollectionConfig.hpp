#pragma once

#include "FieldType.hpp"
#include "Operation.hpp"
#include <string>
#include <utility>
#include <vector>

enum class PayloadFormat {
    Unknown, Raw, Structured, File
};

PayloadFormat parse_payload_format(const std::string& name);

struct FormatConfig {
    std::string type;                                           // raw, structured or file

    // Field name and field type pairs for raw and structured formats
    std::vector<std::pair<std::string, std::string>> options;

    std::string path;                                           // Input file for the file format
    std::string schema_subject;                                 // Structured format only

    PayloadFormat payload_format() const {
        return parse_payload_format(type);
    }

    // Typed field spec; only meaningful after validate() reported no problems
    FieldSpec field_spec() const;

    // Returns every problem found, empty when valid
    std::vector<std::string> validate() const;
};

struct CollectionConfig {
    std::vector<std::string> operations = {"create"};
    FormatConfig format;

    std::vector<Operation> parsed_operations() const {
        return parse_operations(operations);
    }

    std::vector<std::string> validate() const;
};
