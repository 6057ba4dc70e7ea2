#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace idlectl::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("IDLECTL_", 0) == 0) {
    alt = std::string("idlectl_") + n.substr(8);
  } else if (n.rfind("idlectl_", 0) == 0) {
    alt = std::string("IDLECTL_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch(...) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("IDLECTL_CONFIG"))
    return std::string(p); // explicit choice, even if missing
  std::vector<std::string> candidates;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    candidates.push_back(std::string(xdg) + "/idlectl/config.toml");
  if (const char* home = std::getenv("HOME"); home && *home)
    candidates.push_back(std::string(home) + "/.config/idlectl/config.toml");
  candidates.emplace_back("/etc/idlectl/config.toml");
  std::error_code ec;
  for (const auto& c : candidates) {
    if (std::filesystem::is_regular_file(c, ec)) return c;
  }
  return {};
}

static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  return getenv_int(env_name, def);
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  return env_flag(env_name, def);
}

static uint64_t resolve_u64(const util::TomlReader& toml, bool have_toml,
                            const char* section, const char* key,
                            const char* env_name, uint64_t def) {
  if (have_toml && toml.has(section, key))
    return toml.get_u64(section, key, def);
  const char* v = getenv_compat(env_name);
  if (!v || v[0] == '-') return def;
  try {
    size_t used = 0;
    std::string s(v);
    auto r = std::stoull(s, &used, 0);
    return used == s.size() ? r : def;
  } catch (...) {
    return def;
  }
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (const char* v = getenv_compat(env_name)) return v;
  return def;
}

Config load_config_from(const std::string& path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) c.source = path;

  int cpu = resolve_int(toml, have_toml, "verify", "cpu", "IDLECTL_VERIFY_CPU", 0);
  if (cpu < 0) {
    IDLECTL_LOG_WARN("Config", "verify.cpu %d is negative, using 0", cpu);
    cpu = 0;
  }
  c.verify_cpu = static_cast<model::ProcessorId>(cpu);
  c.verify_all = resolve_bool(toml, have_toml, "verify", "all", "IDLECTL_VERIFY_ALL", false);

  uint64_t reg = resolve_u64(toml, have_toml, "msr", "register", "IDLECTL_MSR_REGISTER", msr::kDefaultRegister);
  if (reg > UINT32_MAX) {
    IDLECTL_LOG_WARN("Config", "msr.register 0x%llx out of range, using default",
                     static_cast<unsigned long long>(reg));
    reg = msr::kDefaultRegister;
  }
  c.msr_register = static_cast<uint32_t>(reg);
  c.msr_bit = resolve_int(toml, have_toml, "msr", "bit", "IDLECTL_MSR_BIT", static_cast<int>(msr::kDefaultBit));

  auto def_level = env_flag("IDLECTL_VERBOSE", false) ? util::LogLevel::Info : util::LogLevel::Warn;
  auto level_name = resolve_string(toml, have_toml, "log", "level", "IDLECTL_LOG_LEVEL", "");
  c.log_level = def_level;
  if (!level_name.empty()) {
    if (auto lvl = util::parse_log_level(level_name)) c.log_level = *lvl;
    else IDLECTL_LOG_WARN("Config", "unknown log level '%s'", level_name.c_str());
  }
  return c;
}

Config load_config() {
  return load_config_from(config_file_path());
}

} // namespace idlectl::app
