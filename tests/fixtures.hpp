#pragma once
#include <string>
#include "control/MemoryControlFs.hpp"
#include "control/Topology.hpp"

namespace fixtures {

inline std::string cpu_dir(unsigned cpu) {
  return std::string(idlectl::control::kCpuRoot) + "/cpu" + std::to_string(cpu);
}

inline std::string disable_path(unsigned cpu, unsigned state) {
  return cpu_dir(cpu) + "/cpuidle/state" + std::to_string(state) + "/disable";
}

// cpus 0..ncpus-1, each with idle states 0..nstates-1, all initially enabled,
// plus the non-cpu siblings found on a real host.
inline idlectl::control::MemoryControlFs make_host(unsigned ncpus, unsigned nstates,
                                                   const char* initial = "0\n") {
  idlectl::control::MemoryControlFs fs;
  const std::string root = idlectl::control::kCpuRoot;
  fs.add_file(root + "/online", "0-" + std::to_string(ncpus ? ncpus - 1 : 0) + "\n");
  fs.add_file(root + "/cpuidle/current_driver", "intel_idle\n");
  fs.add_file(root + "/cpufreq/boost", "1\n");
  for (unsigned c = 0; c < ncpus; ++c) {
    fs.add_file(cpu_dir(c) + "/online", "1\n");
    for (unsigned s = 0; s < nstates; ++s) {
      auto base = cpu_dir(c) + "/cpuidle/state" + std::to_string(s);
      fs.add_file(base + "/name", "C" + std::to_string(s) + "\n");
      fs.add_file(base + "/disable", initial);
    }
  }
  return fs;
}

inline bool disabled(const idlectl::control::MemoryControlFs& fs, unsigned cpu, unsigned state) {
  auto v = fs.contents(disable_path(cpu, state));
  return v && !v->empty() && (*v)[0] == '1';
}

} // namespace fixtures
