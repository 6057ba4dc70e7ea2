#pragma once
#include <string>
#include <vector>
#include "control/IControlFs.hpp"
#include "control/Topology.hpp"
#include "model/IdleState.hpp"

namespace idlectl::control {

struct ApplyReport {
  size_t cpus{0};
  std::vector<model::IdleStateRecord> applied; // in write order, up to the failure
  std::vector<std::string> rejected;
  ControlStatus status{};
  std::string failed_path;

  [[nodiscard]] bool ok() const { return status.ok(); }
};

// Enables every idle state at or below the threshold and disables every
// deeper one, on all cpus. Stops at the first failed write; states already
// written stay written.
class CstateController {
public:
  explicit CstateController(IControlFs& fs, std::string root = kCpuRoot);

  [[nodiscard]] ApplyReport apply(model::Threshold threshold);

  // Current state of every idle state of one cpu; empty if the cpu is absent.
  [[nodiscard]] std::vector<model::IdleStateRecord> read_states(model::ProcessorId cpu) const;

  // "<state>/disable:<value>" per idle state, like `grep -R . cpuN/cpuidle/*/disable`.
  [[nodiscard]] std::vector<std::string> verification_lines(model::ProcessorId cpu) const;
  [[nodiscard]] std::vector<std::string> verification_lines_all() const;

private:
  [[nodiscard]] std::vector<std::string> lines_for(const ProcessorEntry& cpu) const;

  IControlFs& fs_;
  Topology topology_;
};

} // namespace idlectl::control
