#include "SchemaRegistry.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

void test_versions_per_subject() {
    SchemaRegistry registry;

    auto v1 = registry.create("users", R"({"fields":[1]})");
    assert(v1.subject == "users" && v1.version == 1);

    auto v2 = registry.create("users", R"({"fields":[2]})");
    assert(v2.version == 2);

    auto other = registry.create("orders", R"({"fields":[1]})");
    assert(other.version == 1);

    assert(registry.latest("users")->version == 2);
    assert(!registry.latest("missing").has_value());
    assert(registry.subjects().size() == 2);
    std::cout << "test_versions_per_subject passed" << std::endl;
}

void test_identical_definition_reuses_version() {
    SchemaRegistry registry;
    registry.create("users", "a");
    registry.create("users", "b");

    auto again = registry.create("users", "a");
    assert(again.version == 1);
    assert(registry.latest("users")->version == 2);
    std::cout << "test_identical_definition_reuses_version passed" << std::endl;
}

void test_get() {
    SchemaRegistry registry;
    registry.create("users", "a");

    assert(registry.get("users", 1).value() == "a");
    assert(!registry.get("users", 0).has_value());
    assert(!registry.get("users", 2).has_value());
    assert(!registry.get("orders", 1).has_value());
    std::cout << "test_get passed" << std::endl;
}

void test_invalid_arguments() {
    SchemaRegistry registry;
    bool thrown = false;
    try {
        registry.create("", "a");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        registry.create("users", "");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    (void)thrown;
    std::cout << "test_invalid_arguments passed" << std::endl;
}

int main() {
    test_versions_per_subject();
    test_identical_definition_reuses_version();
    test_get();
    test_invalid_arguments();

    std::cout << "All SchemaRegistry tests passed!" << std::endl;
    return 0;
}
