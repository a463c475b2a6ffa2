#pragma once

#include "GlobalConfig.hpp"
#include "SourceConfig.hpp"

// Top-level config
struct ConfigData {
    GlobalConfig global;
    SourceConfig source;
};
