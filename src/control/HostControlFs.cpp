#include "control/HostControlFs.hpp"
#include "util/Sysfs.hpp"

namespace idlectl::control {

std::vector<std::string> HostControlFs::list_entries(const std::string& dir) const {
  return idlectl::util::list_dir(dir);
}

std::optional<std::string> HostControlFs::read_control(const std::string& path) const {
  return idlectl::util::read_file_string(path);
}

ControlStatus HostControlFs::write_control(const std::string& path, std::string_view value) {
  int err = idlectl::util::write_file_string(path, value);
  if (err != 0) return ControlStatus::from_errno(err);
  return ControlStatus::success();
}

} // namespace idlectl::control
