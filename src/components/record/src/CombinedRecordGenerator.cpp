#include "CombinedRecordGenerator.hpp"
#include <stdexcept>

std::unique_ptr<IRecordGenerator> CombinedRecordGenerator::combine(
    std::vector<std::unique_ptr<IRecordGenerator>> generators) {

    if (generators.size() == 1 && generators.front()) {
        return std::move(generators.front());
    }
    return std::make_unique<CombinedRecordGenerator>(std::move(generators));
}

CombinedRecordGenerator::CombinedRecordGenerator(std::vector<std::unique_ptr<IRecordGenerator>> generators)
    : generators_(std::move(generators)) {

    if (generators_.empty()) {
        throw std::invalid_argument("Cannot combine an empty list of record generators");
    }
    for (size_t i = 0; i < generators_.size(); ++i) {
        if (!generators_[i]) {
            throw std::invalid_argument("Record generator at index " + std::to_string(i) + " is null");
        }
    }
}

Record CombinedRecordGenerator::next() {
    const size_t index = random_.random_index(generators_.size());
    Record record = generators_[index]->next();
    record.position = std::to_string(index) + kPositionSeparator + record.position;
    return record;
}
