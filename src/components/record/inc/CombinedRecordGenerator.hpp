#pragma once

#include "IRecordGenerator.hpp"
#include "FieldValueGenerator.hpp"
#include <memory>
#include <vector>

// Picks one of several generators uniformly for every record and prefixes the
// generator index to the position as "<index>/<position>".
class CombinedRecordGenerator : public IRecordGenerator {
public:
    // A single generator is returned as is, its positions untouched.
    // Throws std::invalid_argument when generators is empty or holds a null.
    static std::unique_ptr<IRecordGenerator> combine(std::vector<std::unique_ptr<IRecordGenerator>> generators);

    explicit CombinedRecordGenerator(std::vector<std::unique_ptr<IRecordGenerator>> generators);

    Record next() override;

    size_t size() const noexcept { return generators_.size(); }

    static constexpr char kPositionSeparator = '/';

private:
    std::vector<std::unique_ptr<IRecordGenerator>> generators_;
    FieldValueGenerator random_;
};
