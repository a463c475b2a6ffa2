#pragma once

#include "IRecordGenerator.hpp"
#include "IRecordPostProcessor.hpp"
#include "PayloadGenerator.hpp"
#include "FieldValueGenerator.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Generates the records of one collection. Positions are the decimal value of
// a per-instance counter starting at 1.
class RecordGenerator : public IRecordGenerator {
public:
    // Throws std::invalid_argument when operations is empty or payload is null
    RecordGenerator(std::string collection,
                    std::vector<Operation> operations,
                    std::unique_ptr<PayloadGenerator> payload,
                    std::shared_ptr<IRecordPostProcessor> post_processor = nullptr);

    Record next() override;

    const std::string& collection() const noexcept { return collection_; }
    const std::vector<Operation>& operations() const noexcept { return operations_; }
    uint64_t count() const noexcept { return count_; }

private:
    std::string collection_;
    std::vector<Operation> operations_;
    uint64_t count_ = 0;
    std::unique_ptr<PayloadGenerator> payload_;
    std::shared_ptr<IRecordPostProcessor> post_processor_;
    FieldValueGenerator random_;
};
