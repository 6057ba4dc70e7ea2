// mwait_workaround [on|off]: read-modify-write-verify one MSR bit on every cpu.
// Register and bit come from [msr] in the config (default 0xc0011020 bit 9).

#include "app/Commands.hpp"
#include "app/Config.hpp"
#include "control/HostControlFs.hpp"
#include "msr/HostMsrDevice.hpp"
#include "util/Log.hpp"

#include <iostream>

int main(int argc, char** argv) {
  auto cfg = idlectl::app::load_config();
  idlectl::util::set_log_level(cfg.log_level);

  idlectl::control::HostControlFs fs;
  idlectl::msr::HostMsrDevice dev;
  return idlectl::app::mwait_workaround_main(argc, argv, cfg, fs, dev, std::cout, std::cerr);
}
