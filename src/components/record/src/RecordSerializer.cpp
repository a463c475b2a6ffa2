#include "RecordSerializer.hpp"
#include "PayloadSerializer.hpp"
#include <type_traits>

nlohmann::json RecordSerializer::to_json(const PayloadValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, RawData>) {
            return v.bytes;
        } else {
            return PayloadSerializer::to_json(v);
        }
    }, value);
}

nlohmann::ordered_json RecordSerializer::to_json(const Record& record) {
    nlohmann::ordered_json json_data;
    json_data["position"] = record.position;
    json_data["operation"] = operation_name(record.operation);
    json_data["metadata"] = record.metadata;
    json_data["key"] = record.key.bytes;

    nlohmann::ordered_json payload = nlohmann::ordered_json::object();
    if (record.payload.before) {
        payload["before"] = to_json(*record.payload.before);
    }
    if (record.payload.after) {
        payload["after"] = to_json(*record.payload.after);
    }
    json_data["payload"] = std::move(payload);

    return json_data;
}

std::string RecordSerializer::to_line(const Record& record) {
    return to_json(record).dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}
