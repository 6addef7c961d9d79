#include "util/CpuList.hpp"

#include <cctype>
#include <charconv>

namespace lasso::util {

static constexpr int kMaxCpuId = 8191;

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

static std::optional<int> parse_id(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty()) return std::nullopt;
  int v = -1;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
  if (v < 0 || v > kMaxCpuId) return std::nullopt;
  return v;
}

std::optional<std::set<int>> parse_cpulist(std::string_view text) {
  std::set<int> out;
  text = trim(text);
  if (text.empty()) return out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string_view::npos) comma = text.size();
    auto part = trim(text.substr(start, comma - start));
    if (part.empty()) return std::nullopt;
    auto dash = part.find('-');
    if (dash == std::string_view::npos) {
      auto id = parse_id(part);
      if (!id) return std::nullopt;
      out.insert(*id);
    } else {
      auto lo = parse_id(part.substr(0, dash));
      auto hi = parse_id(part.substr(dash + 1));
      if (!lo || !hi || *lo > *hi) return std::nullopt;
      for (int c = *lo; c <= *hi; ++c) out.insert(c);
    }
    start = comma + 1;
  }
  return out;
}

std::string format_cpulist(const std::set<int>& cpus) {
  std::string out;
  auto it = cpus.begin();
  while (it != cpus.end()) {
    int lo = *it, hi = *it;
    ++it;
    while (it != cpus.end() && *it == hi + 1) { hi = *it; ++it; }
    if (!out.empty()) out.push_back(',');
    out += std::to_string(lo);
    if (hi != lo) { out.push_back('-'); out += std::to_string(hi); }
  }
  return out;
}

} // namespace lasso::util
