#pragma once

#include <cstdint>
#include <string>
#include "model/IdleState.hpp"
#include "msr/MsrController.hpp"
#include "util/Log.hpp"

namespace idlectl::app {

struct Config {
  model::ProcessorId verify_cpu{0};
  bool verify_all{false};
  uint32_t msr_register{msr::kDefaultRegister};
  int msr_bit{static_cast<int>(msr::kDefaultBit)};
  util::LogLevel log_level{util::LogLevel::Warn};
  std::string source; // file the values came from; empty when none was found
};

// $IDLECTL_CONFIG, XDG/HOME config dirs, then /etc/idlectl/config.toml.
// Returns the first candidate that exists, or empty.
std::string config_file_path();

// Resolve TOML -> env -> compiled default. A missing file only skips the TOML layer.
Config load_config_from(const std::string& path);
Config load_config();

// Environment helpers accepting IDLECTL_ and idlectl_ prefixes
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace idlectl::app
