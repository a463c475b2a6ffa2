#pragma once

#include "SourceConfig.hpp"
#include "IRecordGenerator.hpp"
#include "BurstScheduler.hpp"
#include "RateLimiter.hpp"
#include "SchemaRegistry.hpp"
#include "CancellationToken.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Pull-based record source. Every pull synthesizes the next record first,
// then waits for the burst window and the rate limiter.
class GeneratorSource {
public:
    // Validates the configuration and builds one generator per collection.
    // Schemas are registered in `registry`, or in a registry owned by the
    // source when none is given. Throws std::invalid_argument for invalid
    // configuration and std::runtime_error naming the collection when a
    // generator cannot be built.
    static std::unique_ptr<GeneratorSource> open(const SourceConfig& config, SchemaRegistry* registry = nullptr);

    GeneratorSource(std::unique_ptr<IRecordGenerator> generator,
                    std::unique_ptr<BurstScheduler> burst,
                    std::unique_ptr<RateLimiter> limiter,
                    int64_t record_count);

    // Returns std::nullopt once the token is cancelled. After record_count
    // records it blocks until cancellation.
    std::optional<Record> pull(const CancellationToken& cancel);

    void ack(const std::string& position);

    void teardown();

    // True once a non-zero record_count has been produced
    bool exhausted() const noexcept {
        return record_count_ > 0 && produced_ >= record_count_;
    }

    int64_t produced() const noexcept { return produced_; }
    int64_t acked() const noexcept { return acked_; }

private:
    std::unique_ptr<SchemaRegistry> owned_registry_;
    std::unique_ptr<IRecordGenerator> generator_;
    std::unique_ptr<BurstScheduler> burst_;
    std::unique_ptr<RateLimiter> limiter_;
    const int64_t record_count_;
    int64_t produced_ = 0;
    int64_t acked_ = 0;
    bool exhaustion_logged_ = false;
    bool torn_down_ = false;
};
