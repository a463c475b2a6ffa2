#include "PayloadGenerator.hpp"
#include "PayloadSerializer.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

PayloadGenerator::PayloadGenerator(Kind kind, FieldSpec fields)
    : kind_(kind), fields_(std::move(fields)) {
    check_field_spec();
}

PayloadGenerator::PayloadGenerator(Kind kind, FieldSpec fields, uint64_t seed)
    : kind_(kind), fields_(std::move(fields)), values_(seed) {
    check_field_spec();
}

PayloadGenerator::PayloadGenerator(FileTag, RawData contents)
    : kind_(Kind::File), file_contents_(std::move(contents)) {}

void PayloadGenerator::check_field_spec() const {
    if (kind_ == Kind::File) {
        throw std::invalid_argument("File payloads must be created with PayloadGenerator::from_file");
    }
    for (const auto& field : fields_) {
        if (field.type == FieldType::UNKNOWN) {
            throw std::invalid_argument("Field \"" + field.name + "\" has an unknown type");
        }
    }
}

std::unique_ptr<PayloadGenerator> PayloadGenerator::from_file(const std::string& path) {
    // Cached so that reading the file never counts against the record rate
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to read file \"" + path + "\": " + std::strerror(errno));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file \"" + path + "\"");
    }

    return std::make_unique<PayloadGenerator>(FileTag{}, RawData{buffer.str()});
}

std::unique_ptr<PayloadGenerator> PayloadGenerator::create(const FormatConfig& format) {
    switch (format.payload_format()) {
        case PayloadFormat::Raw:
            return std::make_unique<PayloadGenerator>(Kind::Raw, format.field_spec());
        case PayloadFormat::Structured:
            return std::make_unique<PayloadGenerator>(Kind::Structured, format.field_spec());
        case PayloadFormat::File:
            return from_file(format.path);
        default:
            throw std::invalid_argument("Unsupported payload format type: " + format.type);
    }
}

StructuredData PayloadGenerator::random_structured_data() {
    StructuredData data;
    for (const auto& field : fields_) {
        data[field.name] = values_.generate(field.type);
    }
    return data;
}

PayloadValue PayloadGenerator::next() {
    switch (kind_) {
        case Kind::Raw:
            return RawData{PayloadSerializer::to_bytes(random_structured_data())};
        case Kind::Structured:
            return random_structured_data();
        case Kind::File:
            return file_contents_;
    }
    throw std::logic_error("Unhandled payload kind");
}
