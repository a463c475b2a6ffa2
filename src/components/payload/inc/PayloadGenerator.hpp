#pragma once

#include "CollectionConfig.hpp"
#include "FieldValueGenerator.hpp"
#include "Record.hpp"
#include <memory>
#include <string>
#include <variant>

// Produces the before/after payload values of one collection. The strategy is
// fixed at construction: raw JSON bytes or a structured map built from a field
// spec, or the cached contents of a file.
class PayloadGenerator {
public:
    enum class Kind { Raw, Structured, File };
    struct FileTag {};

    // Throws std::invalid_argument when the spec has an unknown field type
    PayloadGenerator(Kind kind, FieldSpec fields);
    PayloadGenerator(Kind kind, FieldSpec fields, uint64_t seed);
    // File payload over contents already in memory
    PayloadGenerator(FileTag, RawData contents);

    // Reads the file once, throws std::runtime_error when it is unreadable
    static std::unique_ptr<PayloadGenerator> from_file(const std::string& path);

    static std::unique_ptr<PayloadGenerator> create(const FormatConfig& format);

    PayloadValue next();

    Kind kind() const noexcept { return kind_; }

    // Empty for file payloads
    const FieldSpec& field_spec() const noexcept { return fields_; }

    // Structured values for the field spec, also used to derive schemas
    StructuredData random_structured_data();

private:
    void check_field_spec() const;

    Kind kind_;
    FieldSpec fields_;
    RawData file_contents_;
    FieldValueGenerator values_;
};
