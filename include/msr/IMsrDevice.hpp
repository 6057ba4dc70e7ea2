#pragma once
#include <cstdint>
#include "control/ControlStatus.hpp"
#include "model/IdleState.hpp"

namespace idlectl::msr {

// Per-cpu model-specific register access.
class IMsrDevice {
public:
  virtual ~IMsrDevice() = default;
  [[nodiscard]] virtual control::ControlStatus read(model::ProcessorId cpu, uint32_t reg, uint64_t& out) = 0;
  [[nodiscard]] virtual control::ControlStatus write(model::ProcessorId cpu, uint32_t reg, uint64_t value) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace idlectl::msr
