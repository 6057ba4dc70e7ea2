#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("idlectl_test_toml_" + std::to_string(::getpid()) + "_" + suffix + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

TEST(toml_load_missing_file) {
  idlectl::util::TomlReader tr;
  ASSERT_FALSE(tr.load("/tmp/idlectl_test_toml_nonexistent_file.toml"));
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[verify]\nall = true\n");
  idlectl::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("verify", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("verify", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("verify", "missing_bool", false), false);
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
  ASSERT_FALSE(tr.has("nosection", "key"));
  std::filesystem::remove(path);
}

TEST(toml_comments_and_quotes) {
  auto path = tmp_path("comments");
  write_file(path,
    "# leading comment\n"
    "top = 1\n"
    "[ log ]\n"
    "level = \"info\" # trailing\n"
    "path = \"/var/log/a#b\"\n"
    "count = 7 # seven\n");
  idlectl::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("", "top"), 1);
  ASSERT_EQ(tr.get_string("log", "level"), "info");
  ASSERT_EQ(tr.get_string("log", "path"), "/var/log/a#b");
  ASSERT_EQ(tr.get_int("log", "count"), 7);
  std::filesystem::remove(path);
}

TEST(toml_u64_accepts_hex_and_rejects_garbage) {
  auto path = tmp_path("u64");
  write_file(path,
    "[msr]\n"
    "hex = 0xc0011020\n"
    "dec = 416\n"
    "neg = -1\n"
    "junk = 12ab\n");
  idlectl::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_u64("msr", "hex"), 0xc0011020ull);
  ASSERT_EQ(tr.get_u64("msr", "dec"), 416ull);
  ASSERT_EQ(tr.get_u64("msr", "neg", 5), 5ull);
  ASSERT_EQ(tr.get_u64("msr", "junk", 5), 5ull);
  std::filesystem::remove(path);
}
