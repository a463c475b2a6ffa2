#pragma once

#include "CollectionConfig.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

struct BurstConfig {
    std::chrono::nanoseconds sleep_time{0};                     // 0 disables bursts
    std::chrono::nanoseconds generate_time = std::chrono::seconds(1);
};

struct SourceConfig {
    int64_t record_count = 0;                                   // 0 means unlimited
    double rate = 0.0;                                          // Records per second, 0 means unlimited
    std::chrono::nanoseconds read_time{0};                      // Deprecated, use rate
    BurstConfig burst;

    // Records without a collection name, used only when its format type is set
    CollectionConfig default_collection;
    std::map<std::string, CollectionConfig> collections;

    // Effective records per second, derived from read_time when rate is unset
    double rate_limit() const;

    // Default collection first (keyed by ""), then named collections by name
    std::vector<std::pair<std::string, CollectionConfig>> collection_configs() const;

    // Throws std::invalid_argument listing every problem found
    void validate() const;
};
