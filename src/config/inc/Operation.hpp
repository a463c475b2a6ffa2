#pragma once

#include <string>
#include <vector>

enum class Operation {
    Create,
    Update,
    Delete,
    Snapshot
};

// Throws std::invalid_argument for anything but create, update, delete, snapshot
Operation parse_operation(const std::string& name);

std::vector<Operation> parse_operations(const std::vector<std::string>& names);

const char* operation_name(Operation op);

// Create and snapshot carry only an after image, delete only a before image
inline bool has_before(Operation op) {
    return op == Operation::Update || op == Operation::Delete;
}

inline bool has_after(Operation op) {
    return op != Operation::Delete;
}
