#include "msr/HostMsrDevice.hpp"
#include "util/Sysfs.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

namespace idlectl::msr {

using control::ControlStatus;

std::string HostMsrDevice::device_path(model::ProcessorId cpu) {
  return idlectl::util::map_dev_path("/dev/cpu/" + std::to_string(cpu) + "/msr");
}

ControlStatus HostMsrDevice::read(model::ProcessorId cpu, uint32_t reg, uint64_t& out) {
  auto path = device_path(cpu);
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return ControlStatus::from_errno(errno);
  uint64_t v = 0;
  ssize_t n = ::pread(fd, &v, sizeof(v), static_cast<off_t>(reg));
  int err = (n < 0) ? errno : 0;
  ::close(fd);
  if (n < 0) return ControlStatus::from_errno(err);
  // the msr driver answers EIO for unimplemented registers; a short read is the same
  if (n != static_cast<ssize_t>(sizeof(v))) return ControlStatus::from_errno(EIO);
  out = v;
  return ControlStatus::success();
}

ControlStatus HostMsrDevice::write(model::ProcessorId cpu, uint32_t reg, uint64_t value) {
  auto path = device_path(cpu);
  int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) return ControlStatus::from_errno(errno);
  ssize_t n = ::pwrite(fd, &value, sizeof(value), static_cast<off_t>(reg));
  int err = (n < 0) ? errno : 0;
  ::close(fd);
  if (n < 0) return ControlStatus::from_errno(err);
  if (n != static_cast<ssize_t>(sizeof(value))) return ControlStatus::from_errno(EIO);
  return ControlStatus::success();
}

} // namespace idlectl::msr
