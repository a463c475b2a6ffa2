#include "LogUtils.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <string>

bool log_file_contains(const std::string& log_file, const std::string& keyword) {
    std::ifstream fin(log_file);
    if (!fin.is_open()) return false;
    std::string line;
    while (std::getline(fin, line)) {
        if (line.find(keyword) != std::string::npos) return true;
    }
    return false;
}

void test_parse_level() {
    assert(LogUtils::parse_level("debug") == LogUtils::Level::Debug);
    assert(LogUtils::parse_level("INFO") == LogUtils::Level::Info);
    assert(LogUtils::parse_level("warning") == LogUtils::Level::Warn);
    assert(LogUtils::parse_level("Error") == LogUtils::Level::Error);
    assert(LogUtils::parse_level("fatal") == LogUtils::Level::Fatal);

    bool thrown = false;
    try {
        LogUtils::parse_level("verbose");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    (void)thrown;
    std::cout << "test_parse_level passed" << std::endl;
}

void test_level_filtering() {
    std::string log_file = "testlog/test_level.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::debug("ack for position {}", 42);
    LogUtils::info("opened source with {} collection(s)", 3);
    LogUtils::shutdown();

    assert(std::filesystem::exists(log_file));
    assert(!log_file_contains(log_file, "ack for position 42"));
    assert(log_file_contains(log_file, "opened source with 3 collection(s)"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_level_filtering passed" << std::endl;
}

void test_set_level_runtime() {
    std::string log_file = "testlog/test_set_level.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    LogUtils::init(LogUtils::Level::Warn, log_file, 1024 * 1024, 1);
    LogUtils::info("Info should not appear");
    LogUtils::set_level(LogUtils::Level::Debug);
    LogUtils::debug("Debug {} appear now", "should");
    LogUtils::error("Error log {}", 1);
    LogUtils::fatal("Fatal log");
    LogUtils::shutdown();

    assert(!log_file_contains(log_file, "Info should not appear"));
    assert(log_file_contains(log_file, "Debug should appear now"));
    assert(log_file_contains(log_file, "Error log 1"));
    assert(log_file_contains(log_file, "Fatal log"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_set_level_runtime passed" << std::endl;
}

void test_init_creates_directory() {
    std::string log_file = "testlog/subdir/test_init.log";
    std::filesystem::remove_all("testlog");

    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::info("Wrote {} record(s)", 7);
    LogUtils::shutdown();

    assert(std::filesystem::exists("testlog/subdir"));
    assert(log_file_contains(log_file, "Wrote 7 record(s)"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_init_creates_directory passed" << std::endl;
}

void test_log_without_init() {
    // Falls back to stderr when no logger is installed
    LogUtils::info("no logger {}", "installed");
    LogUtils::error("no logger");
    std::cout << "test_log_without_init passed" << std::endl;
}

int main() {
    test_parse_level();
    test_level_filtering();
    test_set_level_runtime();
    test_init_creates_directory();
    test_log_without_init();

    std::cout << "All LogUtils tests passed!" << std::endl;
    return 0;
}
