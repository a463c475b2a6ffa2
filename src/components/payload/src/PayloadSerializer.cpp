#include "PayloadSerializer.hpp"
#include <fmt/format.h>
#include <ctime>
#include <type_traits>

nlohmann::json PayloadSerializer::to_json(const FieldValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Timestamp>) {
            return format_time(v);
        } else if constexpr (std::is_same_v<T, std::chrono::nanoseconds>) {
            return static_cast<int64_t>(v.count());
        } else {
            return v;
        }
    }, value);
}

nlohmann::json PayloadSerializer::to_json(const StructuredData& data) {
    nlohmann::json json_data = nlohmann::json::object();
    for (const auto& [name, value] : data) {
        json_data[name] = to_json(value);
    }
    return json_data;
}

std::string PayloadSerializer::to_bytes(const StructuredData& data) {
    return to_json(data).dump();
}

std::string PayloadSerializer::format_time(const Timestamp& ts) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch());
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = (since_epoch - secs).count();

    std::time_t tt = static_cast<std::time_t>(secs.count());
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:09}Z",
                       tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                       tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, nanos);
}
