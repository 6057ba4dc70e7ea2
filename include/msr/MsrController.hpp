#pragma once
#include <string>
#include <vector>
#include "control/ControlStatus.hpp"
#include "model/Msr.hpp"
#include "msr/IMsrDevice.hpp"

namespace idlectl::msr {

// MSRC001_1020 bit 9: AMD erratum workaround that keeps MWAIT usable in guests.
inline constexpr uint32_t kDefaultRegister = 0xc0011020;
inline constexpr unsigned kDefaultBit = 9;

struct MsrReport {
  std::vector<model::MsrUpdate> updates;
  control::ControlStatus status{};
  model::ProcessorId failed_cpu{};

  [[nodiscard]] bool ok() const { return status.ok(); }
  [[nodiscard]] bool all_verified() const;
};

// Read-modify-write-verify of one bit, cpu by cpu. A failed read or write
// stops the pass; a mismatching re-read is recorded and the pass continues.
class MsrController {
public:
  explicit MsrController(IMsrDevice& dev) : dev_(dev) {}

  [[nodiscard]] MsrReport apply_bit(const std::vector<model::ProcessorId>& cpus,
                                    uint32_t reg, unsigned bit, bool set);

  // Re-read values as 0x<hex>, consecutive duplicates collapsed.
  [[nodiscard]] static std::vector<std::string> format_values(const MsrReport& rep);

private:
  IMsrDevice& dev_;
};

} // namespace idlectl::msr
