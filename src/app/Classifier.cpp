#include "app/Classifier.hpp"
#include "util/CpuList.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <map>

namespace lasso::app {

using model::ClassificationReason;
using model::CoreFact;
using model::CoreSet;
using model::Topology;
using model::Tristate;

static std::string human_size(uint64_t bytes) {
  char buf[32];
  if (bytes >= (1ull << 20) && bytes % (1ull << 20) == 0)
    std::snprintf(buf, sizeof(buf), "%lluMB", static_cast<unsigned long long>(bytes >> 20));
  else
    std::snprintf(buf, sizeof(buf), "%lluKB", static_cast<unsigned long long>(bytes >> 10));
  return buf;
}

static bool classify_by_cache(const std::vector<CoreFact>& facts, Topology& out) {
  std::map<int, uint64_t> group_size;
  for (const auto& f : facts) {
    if (f.cache_group_id < 0 || f.cache_group_size_bytes == 0) return false;
    auto [it, inserted] = group_size.emplace(f.cache_group_id, f.cache_group_size_bytes);
    // One group reporting two sizes is malformed input; refuse to guess
    if (!inserted && it->second != f.cache_group_size_bytes) return false;
  }
  if (group_size.size() < 2) return false;

  uint64_t lo = UINT64_MAX, hi = 0;
  std::map<uint64_t, int> distinct;
  for (const auto& [gid, size] : group_size) {
    distinct[size]++;
    lo = std::min(lo, size);
    hi = std::max(hi, size);
  }
  if (distinct.size() != 2) return false;

  for (const auto& f : facts) {
    if (group_size[f.cache_group_id] == hi) out.preferred.insert(f.id);
    else out.non_preferred.insert(f.id);
  }
  out.has_asymmetry = true;
  out.reason = ClassificationReason::CacheAsymmetricCCD;
  out.description = "Asymmetric last-level cache. Preferred (" + human_size(hi) + " L3): CPUs " +
                    util::format_cpulist(out.preferred) + ". Non-preferred (" + human_size(lo) +
                    " L3): CPUs " + util::format_cpulist(out.non_preferred) + ".";
  return true;
}

static bool classify_by_core_type(const std::vector<CoreFact>& facts, Topology& out) {
  bool any_perf = false, any_eff = false;
  for (const auto& f : facts) {
    if (f.is_efficiency_core == Tristate::True) any_eff = true;
    if (f.is_efficiency_core == Tristate::False) any_perf = true;
  }
  if (!any_perf || !any_eff) return false;

  for (const auto& f : facts) {
    if (f.is_efficiency_core == Tristate::True) out.non_preferred.insert(f.id);
    else out.preferred.insert(f.id);
  }
  out.has_asymmetry = true;
  out.reason = ClassificationReason::HybridPCoreECore;
  out.description = "Hybrid core types. Performance cores: CPUs " + util::format_cpulist(out.preferred) +
                    ". Efficiency cores: CPUs " + util::format_cpulist(out.non_preferred) + ".";
  return true;
}

Topology classify(const std::vector<CoreFact>& facts) {
  Topology t;
  if (classify_by_cache(facts, t)) return t;
  t = Topology{};
  if (classify_by_core_type(facts, t)) return t;
  t = Topology{};
  t.description = facts.empty()
      ? "No CPU facts available. Treating topology as uniform."
      : "Uniform topology (no asymmetry detected). All " + std::to_string(facts.size()) + " CPUs equal.";
  return t;
}

} // namespace lasso::app
