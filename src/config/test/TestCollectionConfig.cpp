#include "CollectionConfig.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

void test_field_type_parsing() {
    assert(parse_field_type("int") == FieldType::INT);
    assert(parse_field_type(" String ") == FieldType::STRING);
    assert(parse_field_type("TIME") == FieldType::TIME);
    assert(parse_field_type("bool") == FieldType::BOOL);
    assert(parse_field_type("duration") == FieldType::DURATION);
    assert(parse_field_type("float") == FieldType::UNKNOWN);
    assert(std::string(field_type_name(FieldType::DURATION)) == "duration");
    assert(known_field_types().size() == 5);
    std::cout << "test_field_type_parsing passed" << std::endl;
}

void test_operation_parsing() {
    assert(parse_operation("create") == Operation::Create);
    assert(parse_operation("UPDATE") == Operation::Update);
    assert(parse_operation("delete") == Operation::Delete);
    assert(parse_operation("snapshot") == Operation::Snapshot);
    assert(std::string(operation_name(Operation::Snapshot)) == "snapshot");

    bool thrown = false;
    try {
        parse_operation("upsert");
    } catch (const std::invalid_argument& e) {
        thrown = std::string(e.what()).find("upsert") != std::string::npos;
    }
    assert(thrown);
    (void)thrown;

    assert(!has_before(Operation::Create) && has_after(Operation::Create));
    assert(!has_before(Operation::Snapshot) && has_after(Operation::Snapshot));
    assert(has_before(Operation::Update) && has_after(Operation::Update));
    assert(has_before(Operation::Delete) && !has_after(Operation::Delete));
    std::cout << "test_operation_parsing passed" << std::endl;
}

void test_format_validation() {
    FormatConfig raw;
    raw.type = "raw";
    raw.options = {{"id", "int"}, {"name", "string"}};
    assert(raw.validate().empty());
    assert(raw.payload_format() == PayloadFormat::Raw);

    auto spec = raw.field_spec();
    assert(spec.size() == 2);
    assert(spec[0].name == "id" && spec[0].type == FieldType::INT);
    assert(spec[1].name == "name" && spec[1].type == FieldType::STRING);

    FormatConfig bad_type = raw;
    bad_type.options.push_back({"score", "float"});
    auto errors = bad_type.validate();
    assert(errors.size() == 1);
    assert(errors[0].find("score") != std::string::npos);

    FormatConfig empty_name = raw;
    empty_name.options.push_back({" ", "int"});
    assert(empty_name.validate().size() == 1);

    FormatConfig file;
    file.type = "file";
    assert(file.validate().size() == 1);
    file.path = "/tmp/payload.bin";
    assert(file.validate().empty());

    FormatConfig unknown;
    unknown.type = "avro";
    assert(unknown.validate().size() == 1);

    FormatConfig subject_on_raw = raw;
    subject_on_raw.schema_subject = "users";
    assert(subject_on_raw.validate().size() == 1);
    subject_on_raw.type = "structured";
    assert(subject_on_raw.validate().empty());

    std::cout << "test_format_validation passed" << std::endl;
}

void test_collection_validation() {
    CollectionConfig cfg;
    cfg.format.type = "structured";
    cfg.format.options = {{"id", "int"}};
    assert(cfg.operations.size() == 1 && cfg.operations[0] == "create");
    assert(cfg.validate().empty());

    cfg.operations = {"create", "merge"};
    auto errors = cfg.validate();
    assert(errors.size() == 1);
    assert(errors[0].find("failed parsing operation") == 0);

    cfg.operations.clear();
    assert(cfg.validate().size() == 1);

    cfg.operations = {"update", "delete"};
    auto ops = cfg.parsed_operations();
    assert(ops.size() == 2);
    assert(ops[0] == Operation::Update && ops[1] == Operation::Delete);
    std::cout << "test_collection_validation passed" << std::endl;
}

int main() {
    test_field_type_parsing();
    test_operation_parsing();
    test_format_validation();
    test_collection_validation();

    std::cout << "All CollectionConfig tests passed!" << std::endl;
    return 0;
}
