#pragma once

#include "FieldType.hpp"
#include "FieldValue.hpp"
#include "pcg_random.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

// Produces random values for typed fields. Every instance owns its engine, so
// generators never share random state.
class FieldValueGenerator {
public:
    FieldValueGenerator();
    explicit FieldValueGenerator(uint64_t seed);

    // Throws std::logic_error for FieldType::UNKNOWN or any value outside the
    // enum: the configuration layer is expected to reject those earlier.
    FieldValue generate(FieldType type);

    int64_t random_int();
    std::string random_word();
    bool random_bool();
    std::chrono::nanoseconds random_duration();
    Timestamp now() const;

    // Uniform index in [0, count)
    size_t random_index(size_t count);

    static constexpr int64_t kMaxDurationSeconds = 1000;

private:
    pcg32_fast engine_;
};
