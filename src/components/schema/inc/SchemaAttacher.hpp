#pragma once

#include "IRecordPostProcessor.hpp"
#include "SchemaRegistry.hpp"
#include "FieldType.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Registers the payload schema of a structured collection once and stamps its
// subject and version on every record.
class SchemaAttacher : public IRecordPostProcessor {
public:
    // The registered subject is "<collection>.<subject>", or just subject for
    // the default collection
    SchemaAttacher(SchemaRegistry& registry,
                   const std::string& collection,
                   const std::string& subject,
                   const FieldSpec& fields);

    void process(Record& record) override;

    const SchemaInfo& schema() const noexcept { return schema_; }

    static std::string qualified_subject(const std::string& collection, const std::string& subject);

    // Avro record schema for the field spec
    static nlohmann::ordered_json definition(const std::string& name, const FieldSpec& fields);

private:
    SchemaInfo schema_;
    std::string version_;
};
