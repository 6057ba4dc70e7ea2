#include "util/Sysfs.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace idlectl::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static bool under(const std::string& abs, std::string_view top) {
  if (abs.rfind(top, 0) != 0) return false;
  return abs.size() == top.size() || abs[top.size()] == '/';
}

static std::string remap(const std::string& abs, const std::string& root) {
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_sys_path(const std::string& abs) -> std::string {
  if (!under(abs, "/sys")) return abs;
  return remap(abs, env_root("IDLECTL_SYS_ROOT"));
}

auto map_dev_path(const std::string& abs) -> std::string {
  if (!under(abs, "/dev")) return abs;
  return remap(abs, env_root("IDLECTL_DEV_ROOT"));
}

static std::string map_any(const std::string& abs) {
  if (under(abs, "/dev")) return map_dev_path(abs);
  return map_sys_path(abs);
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_any(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return s;
}

auto write_file_string(const std::string& abs, std::string_view value) -> int {
  auto path = map_any(abs);
  int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) return errno;
  int rc = 0;
  size_t off = 0;
  while (off < value.size()) {
    ssize_t n = ::write(fd, value.data() + off, value.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      rc = errno;
      break;
    }
    off += static_cast<size_t>(n);
  }
  // sysfs reports store() failures at close for some attributes
  if (::close(fd) != 0 && rc == 0) rc = errno;
  return rc;
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_any(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

auto trim_value(std::string_view v) -> std::string_view {
  while (!v.empty() && (v.back() == '\n' || v.back() == '\r' || v.back() == ' ' || v.back() == '\t'))
    v.remove_suffix(1);
  while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.remove_prefix(1);
  return v;
}

} // namespace idlectl::util
