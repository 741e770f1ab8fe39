#pragma once
#include "gftmax/common.hpp"
#include <string>

namespace gftmax {

// Overlay the keys present in a JSON file onto `base`. Unknown keys are
// ignored with a warning.
Config loadConfig(const std::string &path, Config base = Config{});

// Throws InvalidConfiguration on the first bad value.
void validateConfig(const Config &cfg);

} // namespace gftmax
