#pragma once
#include <string>
#include "msr/IMsrDevice.hpp"

namespace idlectl::msr {

// /dev/cpu/<N>/msr (msr kernel module), remapped under IDLECTL_DEV_ROOT when set.
// The register index is the file offset; values are 8 bytes, host endian.
class HostMsrDevice : public IMsrDevice {
public:
  control::ControlStatus read(model::ProcessorId cpu, uint32_t reg, uint64_t& out) override;
  control::ControlStatus write(model::ProcessorId cpu, uint32_t reg, uint64_t value) override;
  const char* name() const override { return "msr"; }

  [[nodiscard]] static std::string device_path(model::ProcessorId cpu);
};

} // namespace idlectl::msr
