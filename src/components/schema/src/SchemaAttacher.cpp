#include "SchemaAttacher.hpp"
#include "LogUtils.hpp"
#include <stdexcept>

namespace {

nlohmann::ordered_json avro_type(FieldType type) {
    switch (type) {
        case FieldType::INT:      return "long";
        case FieldType::STRING:   return "string";
        case FieldType::BOOL:     return "boolean";
        case FieldType::DURATION: return "long";
        case FieldType::TIME: {
            nlohmann::ordered_json ts;
            ts["type"] = "long";
            ts["logicalType"] = "timestamp-nanos";
            return ts;
        }
        default:
            throw std::invalid_argument(std::string("No schema type for field type ") + field_type_name(type));
    }
}

}

std::string SchemaAttacher::qualified_subject(const std::string& collection, const std::string& subject) {
    if (collection.empty()) return subject;
    return collection + "." + subject;
}

nlohmann::ordered_json SchemaAttacher::definition(const std::string& name, const FieldSpec& fields) {
    nlohmann::ordered_json schema;
    schema["type"] = "record";
    schema["name"] = name;

    nlohmann::ordered_json field_list = nlohmann::ordered_json::array();
    for (const auto& field : fields) {
        nlohmann::ordered_json entry;
        entry["name"] = field.name;
        entry["type"] = avro_type(field.type);
        field_list.push_back(std::move(entry));
    }
    schema["fields"] = std::move(field_list);
    return schema;
}

SchemaAttacher::SchemaAttacher(SchemaRegistry& registry,
                               const std::string& collection,
                               const std::string& subject,
                               const FieldSpec& fields) {
    const std::string full_subject = qualified_subject(collection, subject);
    schema_ = registry.create(full_subject, definition(full_subject, fields).dump());
    version_ = std::to_string(schema_.version);

    LogUtils::info("Registered schema subject \"{}\" version {}", schema_.subject, schema_.version);
}

void SchemaAttacher::process(Record& record) {
    record.metadata[MetadataKeys::PAYLOAD_SCHEMA_SUBJECT] = schema_.subject;
    record.metadata[MetadataKeys::PAYLOAD_SCHEMA_VERSION] = version_;
}
