#include "SourceRunner.hpp"
#include "LogUtils.hpp"

SourceRunner::SourceRunner(GeneratorSource& source, JsonLinesWriter& writer)
    : source_(source), writer_(writer) {}

uint64_t SourceRunner::run(const CancellationToken& cancel) {
    uint64_t written = 0;

    try {
        while (!cancel.is_cancelled() && !source_.exhausted()) {
            auto record = source_.pull(cancel);
            if (!record) break;

            writer_.write(*record);
            source_.ack(record->position);
            ++written;
        }
    } catch (...) {
        writer_.flush();
        source_.teardown();
        throw;
    }

    writer_.flush();
    source_.teardown();

    LogUtils::info("Wrote {} record(s)", written);
    return written;
}
