#include "control/MemoryControlFs.hpp"

namespace idlectl::control {

void MemoryControlFs::add_file(const std::string& path, std::string contents) {
  files_[path] = std::move(contents);
}

void MemoryControlFs::deny_writes(const std::string& path) { denied_.insert(path); }

void MemoryControlFs::allow_writes(const std::string& path) { denied_.erase(path); }

void MemoryControlFs::remove_file(const std::string& path) { files_.erase(path); }

std::optional<std::string> MemoryControlFs::contents(const std::string& path) const {
  auto it = files_.find(path);
  if (it == files_.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> MemoryControlFs::list_entries(const std::string& dir) const {
  std::string prefix = dir;
  if (prefix.empty() || prefix.back() != '/') prefix.push_back('/');
  std::set<std::string> names;
  for (auto it = files_.lower_bound(prefix); it != files_.end(); ++it) {
    const auto& p = it->first;
    if (p.compare(0, prefix.size(), prefix) != 0) break;
    auto rest = p.substr(prefix.size());
    auto slash = rest.find('/');
    names.insert(slash == std::string::npos ? rest : rest.substr(0, slash));
  }
  return {names.begin(), names.end()};
}

std::optional<std::string> MemoryControlFs::read_control(const std::string& path) const {
  return contents(path);
}

ControlStatus MemoryControlFs::write_control(const std::string& path, std::string_view value) {
  auto it = files_.find(path);
  if (it == files_.end()) return ControlStatus::from_errno(ENOENT);
  if (denied_.contains(path)) return ControlStatus::from_errno(EACCES);
  it->second.assign(value);
  ++writes_;
  return ControlStatus::success();
}

} // namespace idlectl::control
