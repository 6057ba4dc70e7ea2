#pragma once
#include <cerrno>
#include <cstring>
#include <string>

namespace idlectl::control {

enum class ControlError { None, NotFound, Permission, Io };

// Result of a single privileged read or write.
struct ControlStatus {
  ControlError error{ControlError::None};
  int sys_errno{0};

  [[nodiscard]] bool ok() const { return error == ControlError::None; }
  explicit operator bool() const { return ok(); }

  static ControlStatus success() { return {}; }
  static ControlStatus from_errno(int e) {
    ControlError kind = ControlError::Io;
    if (e == ENOENT || e == ENODEV || e == ENXIO) kind = ControlError::NotFound;
    else if (e == EACCES || e == EPERM) kind = ControlError::Permission;
    return ControlStatus{kind, e};
  }
};

[[nodiscard]] inline const char* error_name(ControlError e) {
  switch (e) {
    case ControlError::None: return "ok";
    case ControlError::NotFound: return "not found";
    case ControlError::Permission: return "permission denied";
    case ControlError::Io: return "i/o error";
  }
  return "unknown";
}

[[nodiscard]] inline std::string describe(const ControlStatus& st) {
  std::string out = error_name(st.error);
  if (st.sys_errno != 0) {
    out += " (";
    out += std::strerror(st.sys_errno);
    out += ")";
  }
  return out;
}

} // namespace idlectl::control
