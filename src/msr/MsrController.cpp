#include "msr/MsrController.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdio>

namespace idlectl::msr {

bool MsrReport::all_verified() const {
  return std::all_of(updates.begin(), updates.end(), [](const model::MsrUpdate& u){ return u.verified(); });
}

MsrReport MsrController::apply_bit(const std::vector<model::ProcessorId>& cpus,
                                   uint32_t reg, unsigned bit, bool set) {
  MsrReport rep;
  const uint64_t mask = uint64_t{1} << bit;
  for (auto cpu : cpus) {
    model::MsrUpdate u{};
    u.cpu = cpu;
    auto st = dev_.read(cpu, reg, u.before);
    if (st) {
      u.written = set ? (u.before | mask) : (u.before & ~mask);
      st = dev_.write(cpu, reg, u.written);
    }
    if (st) st = dev_.read(cpu, reg, u.after);
    if (!st) {
      IDLECTL_LOG_ERROR("MsrController", "cpu%u msr 0x%" PRIx32 ": %s", cpu, reg, control::describe(st).c_str());
      rep.status = st;
      rep.failed_cpu = cpu;
      return rep;
    }
    if (!u.verified()) {
      IDLECTL_LOG_WARN("MsrController", "cpu%u msr 0x%" PRIx32 ": wrote 0x%" PRIx64 ", read back 0x%" PRIx64,
                       cpu, reg, u.written, u.after);
    } else {
      IDLECTL_LOG_INFO("MsrController", "cpu%u msr 0x%" PRIx32 ": 0x%" PRIx64 " -> 0x%" PRIx64,
                       cpu, reg, u.before, u.after);
    }
    rep.updates.push_back(u);
  }
  return rep;
}

std::vector<std::string> MsrController::format_values(const MsrReport& rep) {
  std::vector<std::string> out;
  for (const auto& u : rep.updates) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "0x%" PRIx64, u.after);
    if (out.empty() || out.back() != buf) out.emplace_back(buf);
  }
  return out;
}

} // namespace idlectl::msr
