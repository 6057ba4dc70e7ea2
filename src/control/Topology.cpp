#include "control/Topology.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <charconv>

namespace idlectl::control {

auto parse_indexed_name(std::string_view name, std::string_view prefix) -> std::optional<unsigned> {
  if (!name.starts_with(prefix)) return std::nullopt;
  auto digits = name.substr(prefix.size());
  if (digits.empty()) return std::nullopt;
  for (char c : digits) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  unsigned v = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) return std::nullopt;
  return v;
}

Topology::Topology(const IControlFs& fs, std::string root)
    : fs_(fs), root_(std::move(root)) {}

std::vector<ProcessorEntry> Topology::processors(std::vector<std::string>* rejected) const {
  std::vector<ProcessorEntry> out;
  for (const auto& name : fs_.list_entries(root_)) {
    // online, possible, kernel_max, ... are not candidates
    if (!name.starts_with("cpu")) continue;
    auto id = parse_indexed_name(name, "cpu");
    auto path = root_ + "/" + name;
    if (!id) {
      // cpuidle, cpufreq: aggregate directories
      IDLECTL_LOG_DEBUG("Topology", "skipping %s: not a cpu<N> entry", path.c_str());
      if (rejected) rejected->push_back(path);
      continue;
    }
    out.push_back(ProcessorEntry{*id, path});
  }
  std::sort(out.begin(), out.end(), [](const ProcessorEntry& a, const ProcessorEntry& b){ return a.id < b.id; });
  return out;
}

std::vector<IdleStateEntry> Topology::idle_states(const ProcessorEntry& cpu,
                                                  std::vector<std::string>* rejected) const {
  std::vector<IdleStateEntry> out;
  auto dir = cpu.path + "/cpuidle";
  for (const auto& name : fs_.list_entries(dir)) {
    auto path = dir + "/" + name;
    auto id = parse_indexed_name(name, "state");
    if (!id) {
      // per-cpu "driver" directory exists with multiple idle drivers
      if (name.starts_with("state"))
        IDLECTL_LOG_WARN("Topology", "ignoring %s: not a state<N> entry", path.c_str());
      else
        IDLECTL_LOG_DEBUG("Topology", "ignoring %s", path.c_str());
      if (rejected) rejected->push_back(path);
      continue;
    }
    out.push_back(IdleStateEntry{cpu.id, *id, path});
  }
  std::sort(out.begin(), out.end(), [](const IdleStateEntry& a, const IdleStateEntry& b){ return a.state < b.state; });
  return out;
}

std::optional<ProcessorEntry> Topology::find_processor(model::ProcessorId id) const {
  for (auto& p : processors()) {
    if (p.id == id) return p;
  }
  return std::nullopt;
}

TopologyScan Topology::scan() const {
  TopologyScan s;
  s.processors = processors(&s.rejected);
  for (const auto& cpu : s.processors) {
    auto states = idle_states(cpu, &s.rejected);
    if (states.empty()) {
      IDLECTL_LOG_DEBUG("Topology", "%s exposes no idle states", cpu.path.c_str());
    }
    s.states.insert(s.states.end(), states.begin(), states.end());
  }
  IDLECTL_LOG_INFO("Topology", "%zu cpus, %zu idle states, %zu rejected entries",
                   s.processors.size(), s.states.size(), s.rejected.size());
  return s;
}

} // namespace idlectl::control
