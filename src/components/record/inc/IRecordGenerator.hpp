#pragma once

#include "Record.hpp"

class IRecordGenerator {
public:
    virtual ~IRecordGenerator() = default;

    virtual Record next() = 0;
};
