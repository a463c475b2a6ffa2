#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>

using Timestamp = std::chrono::system_clock::time_point;

using FieldValue = std::variant<
    bool,                       // bool
    int64_t,                    // int
    std::string,                // string
    Timestamp,                  // time (UTC)
    std::chrono::nanoseconds    // duration
>;

// Field name to value, keys sorted
using StructuredData = std::map<std::string, FieldValue>;
