// cstate_control <threshold>: allow idle states up to <threshold> on every cpu
// and disable the deeper ones, then dump the reference cpu's disable flags.

#include "app/Commands.hpp"
#include "app/Config.hpp"
#include "control/HostControlFs.hpp"
#include "util/Log.hpp"

#include <iostream>

int main(int argc, char** argv) {
  auto cfg = idlectl::app::load_config();
  idlectl::util::set_log_level(cfg.log_level);
  if (!cfg.source.empty()) IDLECTL_LOG_DEBUG("cstate_control", "config %s", cfg.source.c_str());

  idlectl::control::HostControlFs fs;
  return idlectl::app::cstate_control_main(argc, argv, cfg, fs, std::cout, std::cerr);
}
