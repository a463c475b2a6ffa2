#pragma once

#include "Record.hpp"

// Hook run on every record after synthesis, e.g. to attach schema metadata
class IRecordPostProcessor {
public:
    virtual ~IRecordPostProcessor() = default;

    virtual void process(Record& record) = 0;
};
