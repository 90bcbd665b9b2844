#pragma once
#include <string>
#include "app/config.hpp"

namespace app {

struct CliOptions {
    AppConfig cfg;
    bool help{false};
};

// Sorrend: alapértékek -> --config fájl -> környezet -> parancssori kapcsolók.
// Ismeretlen kapcsoló / hiányzó érték -> ConfigError.
CliOptions parse_args(int argc, char** argv);

std::string usage(const char* prog);

} // namespace app
