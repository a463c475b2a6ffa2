#pragma once

#include <string>

struct GlobalConfig {
    bool verbose = false;
    std::string log_level = "info";
    std::string log_file = "log/syngen.log";
    std::string output = "-";                   // "-" writes JSON lines to stdout
};
