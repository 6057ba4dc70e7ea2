#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "control/ControlStatus.hpp"

namespace idlectl::control {

// Access to the kernel's power-management control hierarchy. Paths are
// absolute (/sys/devices/system/cpu/...) so the host and in-memory
// implementations are interchangeable.
class IControlFs {
public:
  virtual ~IControlFs() = default;

  // Names of the direct children of dir. Empty when dir is missing.
  [[nodiscard]] virtual std::vector<std::string> list_entries(const std::string& dir) const = 0;

  [[nodiscard]] virtual std::optional<std::string> read_control(const std::string& path) const = 0;

  // The control file must already exist; it is never created.
  [[nodiscard]] virtual ControlStatus write_control(const std::string& path, std::string_view value) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace idlectl::control
