#pragma once

#include "FieldValue.hpp"
#include "Operation.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>

// Opaque bytes (raw payloads, file contents, keys)
struct RawData {
    std::string bytes;

    bool operator==(const RawData& other) const { return bytes == other.bytes; }
    bool operator!=(const RawData& other) const { return bytes != other.bytes; }
};

using PayloadValue = std::variant<RawData, StructuredData>;

struct Payload {
    std::optional<PayloadValue> before;
    std::optional<PayloadValue> after;
};

using Metadata = std::map<std::string, std::string>;

namespace MetadataKeys {
    constexpr const char* CREATED_AT = "syngen.createdAt";          // Unix time in nanoseconds
    constexpr const char* COLLECTION = "syngen.collection";
    constexpr const char* PAYLOAD_SCHEMA_SUBJECT = "syngen.payload.schema.subject";
    constexpr const char* PAYLOAD_SCHEMA_VERSION = "syngen.payload.schema.version";
}

struct Record {
    std::string position;
    Operation operation = Operation::Create;
    Metadata metadata;
    RawData key;
    Payload payload;

    std::optional<std::string> collection() const {
        auto it = metadata.find(MetadataKeys::COLLECTION);
        if (it == metadata.end()) return std::nullopt;
        return it->second;
    }

    // Throws std::out_of_range when the metadata has no creation time
    Timestamp created_at() const;
};
