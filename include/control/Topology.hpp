#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "control/IControlFs.hpp"
#include "model/IdleState.hpp"

namespace idlectl::control {

inline constexpr const char* kCpuRoot = "/sys/devices/system/cpu";

struct ProcessorEntry {
  model::ProcessorId id{};
  std::string path; // .../cpu<N>
};

struct IdleStateEntry {
  model::ProcessorId cpu{};
  model::IdleStateId state{};
  std::string path; // .../cpu<N>/cpuidle/state<M>

  [[nodiscard]] std::string disable_path() const { return path + "/disable"; }
};

struct TopologyScan {
  std::vector<ProcessorEntry> processors;
  std::vector<IdleStateEntry> states;
  std::vector<std::string> rejected; // entries that looked like topology but failed to parse
};

// Returns N when name is exactly prefix followed by decimal digits.
[[nodiscard]] auto parse_indexed_name(std::string_view name, std::string_view prefix)
    -> std::optional<unsigned>;

class Topology {
public:
  explicit Topology(const IControlFs& fs, std::string root = kCpuRoot);

  // Sorted by id. Rejected cpu* names are appended to rejected when given.
  [[nodiscard]] std::vector<ProcessorEntry> processors(std::vector<std::string>* rejected = nullptr) const;

  // Sorted by state id. Empty if the cpu has no cpuidle directory.
  [[nodiscard]] std::vector<IdleStateEntry> idle_states(const ProcessorEntry& cpu,
                                                        std::vector<std::string>* rejected = nullptr) const;

  [[nodiscard]] std::optional<ProcessorEntry> find_processor(model::ProcessorId id) const;

  [[nodiscard]] TopologyScan scan() const;

private:
  const IControlFs& fs_;
  std::string root_;
};

} // namespace idlectl::control
