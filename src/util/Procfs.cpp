#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace lasso::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap(const std::string& abs, const char* prefix, const char* env_name) {
  if (abs.rfind(prefix, 0) != 0) return abs;
  auto root = env_root(env_name);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  return remap(abs, "/proc", "LASSO_PROC_ROOT");
}

auto map_sys_path(const std::string& abs) -> std::string {
  return remap(abs, "/sys", "LASSO_SYS_ROOT");
}

auto map_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) == 0) return map_proc_path(abs);
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  return abs;
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs));
  if (!in) return std::nullopt;
  try {
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return s;
  } catch (const std::ios_base::failure&) {
    // Process exited or core went offline between open and read
    return std::nullopt;
  }
}

auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>> {
  std::ifstream in(map_path(abs), std::ios::binary);
  if (!in) return std::nullopt;
  try {
    std::vector<unsigned char> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return buf;
  } catch (const std::ios_base::failure&) {
    return std::nullopt;
  }
}

auto read_trimmed(const std::string& abs) -> std::optional<std::string> {
  auto txt = read_file_string(abs);
  if (!txt) return std::nullopt;
  std::string s = *txt;
  auto nl = s.find('\n');
  if (nl != std::string::npos) s.resize(nl);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.pop_back();
  size_t start = 0;
  while (start < s.size() && (s[start] == ' ' || s[start] == '\t')) ++start;
  return s.substr(start);
}

auto read_int64(const std::string& abs) -> std::optional<long long> {
  auto s = read_trimmed(abs);
  if (!s || s->empty()) return std::nullopt;
  long long v = 0;
  auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), v);
  if (ec != std::errc{} || ptr != s->data() + s->size()) return std::nullopt;
  return v;
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_path(abs);
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

bool path_exists(const std::string& abs) {
  std::error_code ec;
  return std::filesystem::exists(map_path(abs), ec);
}

} // namespace lasso::util
