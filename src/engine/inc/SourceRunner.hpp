#pragma once

#include "GeneratorSource.hpp"
#include "JsonLinesWriter.hpp"
#include "CancellationToken.hpp"
#include <cstdint>

// Drives a source: pull, write, ack, until cancelled or, with a record
// ceiling, until the source is exhausted.
class SourceRunner {
public:
    SourceRunner(GeneratorSource& source, JsonLinesWriter& writer);

    // Returns the number of records written. The source is torn down on exit.
    uint64_t run(const CancellationToken& cancel);

private:
    GeneratorSource& source_;
    JsonLinesWriter& writer_;
};
