#include "RecordGenerator.hpp"
#include <stdexcept>

RecordGenerator::RecordGenerator(std::string collection,
                                 std::vector<Operation> operations,
                                 std::unique_ptr<PayloadGenerator> payload,
                                 std::shared_ptr<IRecordPostProcessor> post_processor)
    : collection_(std::move(collection)),
      operations_(std::move(operations)),
      payload_(std::move(payload)),
      post_processor_(std::move(post_processor)) {

    if (operations_.empty()) {
        throw std::invalid_argument("At least one operation is required");
    }
    if (!payload_) {
        throw std::invalid_argument("Payload generator must not be null");
    }
}

Record RecordGenerator::next() {
    Record record;
    record.position = std::to_string(++count_);
    record.operation = operations_[random_.random_index(operations_.size())];

    auto created_at = std::chrono::duration_cast<std::chrono::nanoseconds>(
        random_.now().time_since_epoch()).count();
    record.metadata[MetadataKeys::CREATED_AT] = std::to_string(created_at);
    if (!collection_.empty()) {
        record.metadata[MetadataKeys::COLLECTION] = collection_;
    }

    record.key = RawData{random_.random_word()};

    // update gets two independently generated images
    if (has_before(record.operation)) {
        record.payload.before = payload_->next();
    }
    if (has_after(record.operation)) {
        record.payload.after = payload_->next();
    }

    if (post_processor_) {
        post_processor_->process(record);
    }
    return record;
}
