// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace lasso::util {

// Map an absolute /proc path to an alternate root if LASSO_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if LASSO_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Apply whichever of the two remaps matches the path prefix
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read entire file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>>;

// First line of a file with trailing whitespace removed
auto read_trimmed(const std::string& abs) -> std::optional<std::string>;

// Read a file holding a single integer
auto read_int64(const std::string& abs) -> std::optional<long long>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

[[nodiscard]] bool path_exists(const std::string& abs);

} // namespace lasso::util
