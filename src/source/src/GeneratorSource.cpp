#include "GeneratorSource.hpp"
#include "CombinedRecordGenerator.hpp"
#include "RecordGenerator.hpp"
#include "SchemaAttacher.hpp"
#include "DurationUtils.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <stdexcept>
#include <vector>

namespace {

std::string describe(const std::string& collection) {
    return collection.empty() ? "default collection" : "collection \"" + collection + "\"";
}

std::unique_ptr<IRecordGenerator> build_generator(const std::string& collection,
                                                  const CollectionConfig& cfg,
                                                  SchemaRegistry& registry) {
    auto payload = PayloadGenerator::create(cfg.format);

    std::shared_ptr<IRecordPostProcessor> post_processor;
    if (payload->kind() == PayloadGenerator::Kind::Structured && !cfg.format.schema_subject.empty()) {
        post_processor = std::make_shared<SchemaAttacher>(
            registry, collection, cfg.format.schema_subject, payload->field_spec());
    }

    return std::make_unique<RecordGenerator>(
        collection, cfg.parsed_operations(), std::move(payload), std::move(post_processor));
}

}

std::unique_ptr<GeneratorSource> GeneratorSource::open(const SourceConfig& config, SchemaRegistry* registry) {
    config.validate();

    std::unique_ptr<SchemaRegistry> owned_registry;
    if (!registry) {
        owned_registry = std::make_unique<SchemaRegistry>();
        registry = owned_registry.get();
    }

    std::vector<std::unique_ptr<IRecordGenerator>> generators;
    for (const auto& [collection, cfg] : config.collection_configs()) {
        try {
            generators.push_back(build_generator(collection, cfg, *registry));
        } catch (const std::exception& e) {
            throw std::runtime_error("failed to create record generator for " + describe(collection) + ": " + e.what());
        }
        LogUtils::info("Configured {} with format {} and operations [{}]",
                       describe(collection), cfg.format.type, StringUtils::join(cfg.operations, ", "));
    }
    const size_t collection_count = generators.size();

    auto source = std::make_unique<GeneratorSource>(
        CombinedRecordGenerator::combine(std::move(generators)),
        std::make_unique<BurstScheduler>(config.burst.sleep_time, config.burst.generate_time),
        std::make_unique<RateLimiter>(config.rate_limit()),
        config.record_count);
    source->owned_registry_ = std::move(owned_registry);

    LogUtils::info("Opened generator source with {} collection(s), record_count: {}, rate: {}/s, burst sleep_time: {}, generate_time: {}",
                   collection_count, config.record_count, config.rate_limit(),
                   DurationUtils::format(config.burst.sleep_time), DurationUtils::format(config.burst.generate_time));
    return source;
}

GeneratorSource::GeneratorSource(std::unique_ptr<IRecordGenerator> generator,
                                 std::unique_ptr<BurstScheduler> burst,
                                 std::unique_ptr<RateLimiter> limiter,
                                 int64_t record_count)
    : generator_(std::move(generator)),
      burst_(std::move(burst)),
      limiter_(std::move(limiter)),
      record_count_(record_count) {

    if (!generator_) {
        throw std::invalid_argument("GeneratorSource requires a record generator");
    }
    if (record_count_ < 0) {
        throw std::invalid_argument("Record count must be greater or equal to 0");
    }
}

std::optional<Record> GeneratorSource::pull(const CancellationToken& cancel) {
    if (torn_down_) {
        throw std::logic_error("pull called after teardown");
    }
    if (cancel.is_cancelled()) {
        return std::nullopt;
    }

    if (exhausted()) {
        if (!exhaustion_logged_) {
            LogUtils::info("Produced all {} record(s), waiting for shutdown", record_count_);
            exhaustion_logged_ = true;
        }
        cancel.wait();
        return std::nullopt;
    }

    // Synthesized before any waiting so the wait covers generation time
    Record record = generator_->next();

    if (burst_ && burst_->wait(cancel) == WaitStatus::Cancelled) {
        return std::nullopt;
    }
    if (limiter_ && limiter_->wait(cancel) == WaitStatus::Cancelled) {
        return std::nullopt;
    }

    ++produced_;
    return record;
}

void GeneratorSource::ack(const std::string& position) {
    ++acked_;
    LogUtils::debug("Got ack for position {}", position);
}

void GeneratorSource::teardown() {
    if (torn_down_) return;
    torn_down_ = true;
    LogUtils::info("Generator source stopped after producing {} record(s), {} acked", produced_, acked_);
}
