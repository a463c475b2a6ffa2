#include "DurationUtils.hpp"
#include "StringUtils.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace {

int64_t unit_to_nanoseconds(const std::string& unit, const std::string& text) {
    if (unit == "ns") return 1LL;
    if (unit == "us") return 1000LL;
    if (unit == "ms") return 1000LL * 1000LL;
    if (unit == "s")  return 1000LL * 1000LL * 1000LL;
    if (unit == "m")  return 60LL * 1000LL * 1000LL * 1000LL;
    if (unit == "h")  return 60LL * 60LL * 1000LL * 1000LL * 1000LL;
    if (unit.empty()) {
        throw std::invalid_argument("Missing unit in duration: " + text);
    }
    throw std::invalid_argument("Unknown unit \"" + unit + "\" in duration: " + text);
}

}

DurationUtils::Duration DurationUtils::parse(const std::string& text) {
    std::string trimmed = text;
    StringUtils::remove_all_spaces(trimmed);

    if (trimmed.empty()) {
        throw std::invalid_argument("Invalid duration: empty string");
    }

    size_t pos = 0;
    bool negative = false;
    if (trimmed[0] == '-' || trimmed[0] == '+') {
        negative = trimmed[0] == '-';
        pos = 1;
    }

    if (trimmed.substr(pos) == "0") {
        return Duration::zero();
    }
    if (pos >= trimmed.size()) {
        throw std::invalid_argument("Invalid duration: " + text);
    }

    long double total = 0;
    while (pos < trimmed.size()) {
        size_t number_start = pos;
        while (pos < trimmed.size() && (std::isdigit(static_cast<unsigned char>(trimmed[pos])) || trimmed[pos] == '.')) {
            ++pos;
        }
        std::string number_part = trimmed.substr(number_start, pos - number_start);
        if (number_part.empty() || number_part == ".") {
            throw std::invalid_argument("Invalid number in duration: " + text);
        }

        size_t unit_start = pos;
        while (pos < trimmed.size() && std::isalpha(static_cast<unsigned char>(trimmed[pos]))) {
            ++pos;
        }
        std::string unit_part = trimmed.substr(unit_start, pos - unit_start);

        long double value = 0;
        size_t parsed = 0;
        try {
            value = std::stold(number_part, &parsed);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid number in duration: " + text);
        }
        if (parsed != number_part.size()) {
            throw std::invalid_argument("Invalid number in duration: " + text);
        }
        total += value * static_cast<long double>(unit_to_nanoseconds(unit_part, text));
    }

    if (total > static_cast<long double>(std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("Duration out of range: " + text);
    }

    auto nanos = static_cast<int64_t>(std::llround(total));
    return Duration(negative ? -nanos : nanos);
}

std::string DurationUtils::format(Duration duration) {
    int64_t nanos = duration.count();
    if (nanos == 0) {
        return "0s";
    }

    static const struct {
        int64_t factor;
        const char* unit;
    } units[] = {
        {60LL * 60LL * 1000LL * 1000LL * 1000LL, "h"},
        {60LL * 1000LL * 1000LL * 1000LL, "m"},
        {1000LL * 1000LL * 1000LL, "s"},
        {1000LL * 1000LL, "ms"},
        {1000LL, "us"},
        {1LL, "ns"},
    };

    for (const auto& u : units) {
        if (nanos % u.factor == 0) {
            return std::to_string(nanos / u.factor) + u.unit;
        }
    }
    return std::to_string(nanos) + "ns";
}
