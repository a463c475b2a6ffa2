#include "Operation.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

Operation parse_operation(const std::string& name) {
    const std::string lower = StringUtils::to_lower(StringUtils::trimmed(name));
    if (lower == "create")   return Operation::Create;
    if (lower == "update")   return Operation::Update;
    if (lower == "delete")   return Operation::Delete;
    if (lower == "snapshot") return Operation::Snapshot;
    throw std::invalid_argument("Unknown operation \"" + name + "\", allowed values are create, update, delete, snapshot");
}

std::vector<Operation> parse_operations(const std::vector<std::string>& names) {
    std::vector<Operation> operations;
    operations.reserve(names.size());
    for (const auto& name : names) {
        operations.push_back(parse_operation(name));
    }
    return operations;
}

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::Create:   return "create";
        case Operation::Update:   return "update";
        case Operation::Delete:   return "delete";
        case Operation::Snapshot: return "snapshot";
    }
    return "unknown";
}
