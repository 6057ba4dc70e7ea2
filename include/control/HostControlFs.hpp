#pragma once
#include "control/IControlFs.hpp"

namespace idlectl::control {

// Live sysfs, remapped under IDLECTL_SYS_ROOT when set.
class HostControlFs : public IControlFs {
public:
  std::vector<std::string> list_entries(const std::string& dir) const override;
  std::optional<std::string> read_control(const std::string& path) const override;
  ControlStatus write_control(const std::string& path, std::string_view value) override;
  const char* name() const override { return "sysfs"; }
};

} // namespace idlectl::control
