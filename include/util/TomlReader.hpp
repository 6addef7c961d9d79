#pragma once

#include <cctype>
#include <charconv>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace lasso::util {

// Flat TOML subset: [section] headers and key = value lines. Section order and
// key order are preserved across load/save so ordered lists can be stored as
// numbered sections ([rule.0], [rule.1], ...).
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      auto raw = trim(sv.substr(eq + 1));
      std::string val;
      if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"')
        val = unescape(raw.substr(1, raw.size() - 2));
      else
        val = std::string(strip_comment(raw));
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  // Writes to a sibling temp file and renames it over the target
  bool save(const std::string& path) const {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    const std::string tmp = path + ".tmp";
    {
      std::ofstream out(tmp, std::ios::trunc);
      if (!out.is_open()) return false;
      bool first = true;
      for (const auto& [name, sec] : sections_) {
        if (!first) out << '\n';
        first = false;
        if (!name.empty()) out << '[' << name << "]\n";
        for (const auto& [k, v] : sec.entries) {
          if (needs_quoting(v))
            out << k << " = \"" << escape(v) << "\"\n";
          else
            out << k << " = " << v << '\n';
        }
      }
      out.flush();
      if (!out.good()) return false;
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      return false;
    }
    return true;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    int out = 0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), out);
    if (ec != std::errc{} || ptr != val.data() + val.size()) return def;
    return out;
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), out);
    if (ec != std::errc{} || ptr != val.data() + val.size()) return def;
    return out;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }

  void set(const std::string& section, const std::string& key, const char* value) {
    ensure_section(section).set(key, std::string(value));
  }

  void set(const std::string& section, const std::string& key, int value) {
    ensure_section(section).set(key, std::to_string(value));
  }

  void set(const std::string& section, const std::string& key, double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    std::string s(buf);
    // 85.000 -> 85.0
    while (s.size() > 1 && s.back() == '0' && s[s.size() - 2] != '.') s.pop_back();
    ensure_section(section).set(key, s);
  }

  void set(const std::string& section, const std::string& key, bool value) {
    ensure_section(section).set(key, value ? "true" : "false");
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  [[nodiscard]] bool has_section(std::string_view section) const {
    return find_section(section) != nullptr;
  }

  // Section names in file order
  [[nodiscard]] std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    out.reserve(sections_.size());
    for (const auto& [n, s] : sections_) out.push_back(n);
    return out;
  }

  void remove_section(std::string_view section) {
    for (auto it = sections_.begin(); it != sections_.end(); ++it) {
      if (it->first == section) { sections_.erase(it); return; }
    }
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Bare values may carry a trailing "# comment"
  static std::string_view strip_comment(std::string_view sv) {
    auto hash = sv.find('#');
    if (hash != std::string_view::npos) sv = sv.substr(0, hash);
    return trim(sv);
  }

  static std::string escape(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
      if (c == '\\') out += "\\\\";
      else if (c == '"') out += "\\\"";
      else if (c == '\n') out += "\\n";
      else if (c == '\t') out += "\\t";
      else out.push_back(c);
    }
    return out;
  }

  static std::string unescape(std::string_view v) {
    std::string out;
    out.reserve(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
      char c = v[i];
      if (c == '\\' && i + 1 < v.size()) {
        char n = v[++i];
        if (n == 'n') out.push_back('\n');
        else if (n == 't') out.push_back('\t');
        else out.push_back(n);  // \\ and \" and unknown escapes keep the char
      } else {
        out.push_back(c);
      }
    }
    return out;
  }

  static bool needs_quoting(const std::string& val) {
    if (val.empty()) return true;
    if (val == "true" || val == "false") return false;
    size_t start = (val[0] == '-') ? 1 : 0;
    if (start >= val.size()) return true;
    bool seen_dot = false;
    for (size_t i = start; i < val.size(); ++i) {
      char c = val[i];
      if (c == '.' && !seen_dot && i > start && i + 1 < val.size()) { seen_dot = true; continue; }
      if (!std::isdigit(static_cast<unsigned char>(c))) return true;
    }
    return false;
  }
};

} // namespace lasso::util
