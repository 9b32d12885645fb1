#ifndef INCLUDE_SANDCELL_CONFIG_H_
#define INCLUDE_SANDCELL_CONFIG_H_

#include <filesystem>

#include "sandbox.h"

namespace fs = std::filesystem;

extern SandboxBackend kSandboxBackend;

// Reads an INI file into the configuration globals. Returns false if the file
// cannot be opened; throws std::invalid_argument on malformed values.
bool ParseConfig(const fs::path& conf_path);

#endif  // INCLUDE_SANDCELL_CONFIG_H_
