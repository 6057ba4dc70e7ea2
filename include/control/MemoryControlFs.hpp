#pragma once
#include <map>
#include <set>
#include "control/IControlFs.hpp"

namespace idlectl::control {

// In-memory control hierarchy. Directories exist implicitly as prefixes of
// file paths; writes only replace existing files.
class MemoryControlFs : public IControlFs {
public:
  void add_file(const std::string& path, std::string contents);
  // Subsequent writes to path fail with EACCES.
  void deny_writes(const std::string& path);
  void allow_writes(const std::string& path);
  void remove_file(const std::string& path);

  [[nodiscard]] std::optional<std::string> contents(const std::string& path) const;
  [[nodiscard]] size_t write_count() const { return writes_; }

  std::vector<std::string> list_entries(const std::string& dir) const override;
  std::optional<std::string> read_control(const std::string& path) const override;
  ControlStatus write_control(const std::string& path, std::string_view value) override;
  const char* name() const override { return "memory"; }

private:
  std::map<std::string, std::string> files_;
  std::set<std::string> denied_;
  size_t writes_{0};
};

} // namespace idlectl::control
