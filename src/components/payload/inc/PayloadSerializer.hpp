#pragma once

#include "FieldValue.hpp"
#include <nlohmann/json.hpp>
#include <string>

class PayloadSerializer {
public:
    // time values become RFC 3339 UTC strings with nanoseconds, durations
    // become integer nanoseconds
    static nlohmann::json to_json(const StructuredData& data);

    static nlohmann::json to_json(const FieldValue& value);

    // Canonical compact JSON encoding, keys sorted
    static std::string to_bytes(const StructuredData& data);

    static std::string format_time(const Timestamp& ts);
};
