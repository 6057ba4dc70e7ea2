#pragma once
#include <cstdint>
#include <vector>

namespace idlectl::model {

using ProcessorId = unsigned;
using IdleStateId = unsigned;
using Threshold = int;

struct IdleStateRecord {
  ProcessorId cpu{};
  IdleStateId state{};
  bool enabled{true};
};

// Policy: a state stays enabled only when it is not deeper than the threshold.
[[nodiscard]] constexpr bool state_allowed(IdleStateId state, Threshold threshold) {
  return static_cast<long long>(state) <= static_cast<long long>(threshold);
}

} // namespace idlectl::model
