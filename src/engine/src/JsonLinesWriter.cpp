#include "JsonLinesWriter.hpp"
#include "RecordSerializer.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>

JsonLinesWriter::JsonLinesWriter(std::ostream& out) : out_(&out) {}

std::unique_ptr<JsonLinesWriter> JsonLinesWriter::open(const std::string& target) {
    if (target.empty() || target == "-") {
        return std::make_unique<JsonLinesWriter>(std::cout);
    }

    std::filesystem::path path(target);
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
        std::filesystem::create_directories(path.parent_path());
    }

    auto file = std::make_unique<std::ofstream>(target, std::ios::out | std::ios::trunc);
    if (!file->is_open()) {
        throw std::runtime_error("Failed to open output file \"" + target + "\": " + std::strerror(errno));
    }

    auto writer = std::make_unique<JsonLinesWriter>(*file);
    writer->file_ = std::move(file);
    return writer;
}

void JsonLinesWriter::write(const Record& record) {
    *out_ << RecordSerializer::to_line(record) << '\n';
    if (!*out_) {
        throw std::runtime_error("Failed to write record " + record.position);
    }
    ++written_;
}

void JsonLinesWriter::flush() {
    out_->flush();
}
