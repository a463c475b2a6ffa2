#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct SchemaInfo {
    std::string subject;
    int version = 0;
};

// In-process subject to versioned schema store. Versions start at 1 per
// subject; registering a definition that already exists under the subject
// returns the existing version.
class SchemaRegistry {
public:
    // Throws std::invalid_argument for an empty subject or definition
    SchemaInfo create(const std::string& subject, const std::string& definition);

    std::optional<std::string> get(const std::string& subject, int version) const;

    std::optional<SchemaInfo> latest(const std::string& subject) const;

    std::vector<std::string> subjects() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> schemas_;
};
