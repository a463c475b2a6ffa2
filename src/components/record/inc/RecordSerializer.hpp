#pragma once

#include "Record.hpp"
#include <nlohmann/json.hpp>
#include <string>

class RecordSerializer {
public:
    // {"position", "operation", "metadata", "key", "payload": {"before", "after"}}.
    // Raw bytes become JSON strings, structured payloads become objects.
    static nlohmann::ordered_json to_json(const Record& record);

    // Single line, invalid UTF-8 in raw bytes is replaced
    static std::string to_line(const Record& record);

    static nlohmann::json to_json(const PayloadValue& value);
};
