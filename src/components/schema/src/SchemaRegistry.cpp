#include "SchemaRegistry.hpp"
#include <algorithm>
#include <stdexcept>

SchemaInfo SchemaRegistry::create(const std::string& subject, const std::string& definition) {
    if (subject.empty()) {
        throw std::invalid_argument("Schema subject must not be empty");
    }
    if (definition.empty()) {
        throw std::invalid_argument("Schema definition for subject \"" + subject + "\" must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& versions = schemas_[subject];

    auto it = std::find(versions.begin(), versions.end(), definition);
    if (it != versions.end()) {
        return SchemaInfo{subject, static_cast<int>(it - versions.begin()) + 1};
    }

    versions.push_back(definition);
    return SchemaInfo{subject, static_cast<int>(versions.size())};
}

std::optional<std::string> SchemaRegistry::get(const std::string& subject, int version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schemas_.find(subject);
    if (it == schemas_.end() || version < 1 || static_cast<size_t>(version) > it->second.size()) {
        return std::nullopt;
    }
    return it->second[version - 1];
}

std::optional<SchemaInfo> SchemaRegistry::latest(const std::string& subject) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schemas_.find(subject);
    if (it == schemas_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return SchemaInfo{subject, static_cast<int>(it->second.size())};
}

std::vector<std::string> SchemaRegistry::subjects() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(schemas_.size());
    for (const auto& entry : schemas_) {
        result.push_back(entry.first);
    }
    return result;
}
