#include "Record.hpp"
#include <stdexcept>

Timestamp Record::created_at() const {
    auto it = metadata.find(MetadataKeys::CREATED_AT);
    if (it == metadata.end()) {
        throw std::out_of_range("Record " + position + " has no " + MetadataKeys::CREATED_AT + " metadata");
    }
    auto nanos = std::chrono::nanoseconds(std::stoll(it->second));
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(nanos));
}
