// Helpers for reading and writing /sys and /dev control files with optional root remap
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace idlectl::util {

// Map an absolute /sys path to an alternate root if IDLECTL_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Map an absolute /dev path to an alternate root if IDLECTL_DEV_ROOT is set
auto map_dev_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Write value to an existing file (no O_CREAT). Returns 0 or the errno of the failure.
auto write_file_string(const std::string& abs, std::string_view value) -> int;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// Strip trailing whitespace/newline as found in sysfs attribute reads.
auto trim_value(std::string_view v) -> std::string_view;

} // namespace idlectl::util
