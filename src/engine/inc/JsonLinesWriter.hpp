#pragma once

#include "Record.hpp"
#include <cstdint>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>

// Writes one JSON document per record and line
class JsonLinesWriter {
public:
    explicit JsonLinesWriter(std::ostream& out);

    // "-" writes to stdout, anything else truncates and writes the file.
    // Throws std::runtime_error when the file cannot be opened.
    static std::unique_ptr<JsonLinesWriter> open(const std::string& target);

    // Throws std::runtime_error when the stream fails
    void write(const Record& record);

    void flush();

    uint64_t written() const noexcept { return written_; }

private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_;
    uint64_t written_ = 0;
};
