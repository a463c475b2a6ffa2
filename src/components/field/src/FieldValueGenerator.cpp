#include "FieldValueGenerator.hpp"
#include <limits>
#include <random>
#include <stdexcept>

namespace {

const char* const kWords[] = {
    "amber", "anchor", "apple", "arrow", "aspen", "atlas", "autumn", "badge",
    "bamboo", "basil", "beacon", "birch", "blossom", "breeze", "brook", "cactus",
    "canyon", "cedar", "cherry", "cinder", "clover", "cobalt", "comet", "coral",
    "cotton", "crystal", "daisy", "delta", "dune", "ember", "falcon", "fern",
    "fjord", "flint", "forest", "galaxy", "garnet", "ginger", "glacier", "granite",
    "harbor", "hazel", "heron", "horizon", "indigo", "iris", "island", "ivory",
    "jasmine", "jade", "juniper", "kelp", "kestrel", "lagoon", "lantern", "lemon",
    "lilac", "lotus", "maple", "marble", "meadow", "mesa", "meteor", "mint",
    "nebula", "nectar", "oasis", "olive", "onyx", "orchid", "otter", "pebble",
    "pepper", "pine", "plum", "prairie", "quartz", "quill", "raven", "reef",
    "river", "robin", "saffron", "sage", "sequoia", "shadow", "sierra", "spruce",
    "summit", "thistle", "thunder", "tulip", "tundra", "umber", "valley", "velvet",
    "violet", "walnut", "willow", "zephyr"
};

constexpr size_t kWordCount = sizeof(kWords) / sizeof(kWords[0]);

}

FieldValueGenerator::FieldValueGenerator()
    : engine_(pcg_extras::seed_seq_from<std::random_device>{}) {}

FieldValueGenerator::FieldValueGenerator(uint64_t seed)
    : engine_(seed) {}

FieldValue FieldValueGenerator::generate(FieldType type) {
    switch (type) {
        case FieldType::INT:
            return random_int();
        case FieldType::STRING:
            return random_word();
        case FieldType::TIME:
            return now();
        case FieldType::BOOL:
            return random_bool();
        case FieldType::DURATION:
            return random_duration();
        default:
            throw std::logic_error("Field type \"" + std::string(field_type_name(type)) + "\" cannot be generated, "
                                   "it should have been rejected by configuration validation");
    }
}

int64_t FieldValueGenerator::random_int() {
    std::uniform_int_distribution<int64_t> dist(0, std::numeric_limits<int64_t>::max());
    return dist(engine_);
}

std::string FieldValueGenerator::random_word() {
    return kWords[random_index(kWordCount)];
}

bool FieldValueGenerator::random_bool() {
    std::bernoulli_distribution dist(0.5);
    return dist(engine_);
}

std::chrono::nanoseconds FieldValueGenerator::random_duration() {
    std::uniform_int_distribution<int64_t> dist(0, kMaxDurationSeconds - 1);
    return std::chrono::seconds(dist(engine_));
}

Timestamp FieldValueGenerator::now() const {
    return std::chrono::system_clock::now();
}

size_t FieldValueGenerator::random_index(size_t count) {
    if (count == 0) {
        throw std::invalid_argument("random_index requires a non-empty range");
    }
    std::uniform_int_distribution<size_t> dist(0, count - 1);
    return dist(engine_);
}
