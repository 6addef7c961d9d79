#include "collectors/CpuTopologyCollector.hpp"
#include "util/CpuList.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace lasso::collectors {

using model::CoreFact;
using model::CoreId;
using model::CoreSet;
using model::Tristate;

static const std::string kCpuRoot = "/sys/devices/system/cpu";

static CoreSet read_cpulist_file(const std::string& path) {
  auto txt = util::read_trimmed(path);
  if (!txt) return {};
  auto set = util::parse_cpulist(*txt);
  return set ? *set : CoreSet{};
}

// "32768K", "96M", "1048576" -> bytes
static uint64_t parse_cache_size(const std::string& s) {
  if (s.empty()) return 0;
  size_t i = 0;
  uint64_t v = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { v = v * 10 + static_cast<uint64_t>(s[i] - '0'); ++i; }
  if (i == 0) return 0;
  if (i < s.size()) {
    char u = static_cast<char>(std::toupper(static_cast<unsigned char>(s[i])));
    if (u == 'K') v <<= 10;
    else if (u == 'M') v <<= 20;
    else if (u == 'G') v <<= 30;
  }
  return v;
}

static void read_llc(CoreId cpu, CoreFact& f) {
  std::string cache_dir = kCpuRoot + "/cpu" + std::to_string(cpu) + "/cache";
  for (const auto& entry : util::list_dir(cache_dir)) {
    if (entry.rfind("index", 0) != 0) continue;
    std::string idx = cache_dir + "/" + entry;
    auto level = util::read_int64(idx + "/level");
    if (!level || *level != 3) continue;
    auto size = util::read_trimmed(idx + "/size");
    if (size) f.cache_group_size_bytes = parse_cache_size(*size);
    if (auto id = util::read_int64(idx + "/id")) {
      f.cache_group_id = static_cast<int>(*id);
    } else {
      // Older kernels have no id file; the lowest sharing CPU names the group
      auto shared = read_cpulist_file(idx + "/shared_cpu_list");
      if (!shared.empty()) f.cache_group_id = *shared.begin();
    }
    return;
  }
}

std::vector<CoreFact> CpuTopologyCollector::collect() {
  std::vector<CoreFact> facts;
  auto present = present_cores();
  if (present.empty()) {
    LASSO_LOG_WARN("Topology", "no CPUs listed in %s/present", kCpuRoot.c_str());
    return facts;
  }

  for (CoreId cpu : present) {
    CoreFact f;
    f.id = cpu;
    std::string base = kCpuRoot + "/cpu" + std::to_string(cpu);
    if (auto khz = util::read_int64(base + "/cpufreq/cpuinfo_max_freq"); khz && *khz > 0)
      f.max_frequency_hz = static_cast<uint64_t>(*khz) * 1000ull;
    read_llc(cpu, f);
    facts.push_back(f);
  }

  // Hybrid parts publish one PMU per core type
  bool have_pmu = util::path_exists("/sys/devices/cpu_atom/cpus");
  if (have_pmu) {
    auto atom = read_cpulist_file("/sys/devices/cpu_atom/cpus");
    auto core = read_cpulist_file("/sys/devices/cpu_core/cpus");
    for (auto& f : facts) {
      if (atom.count(f.id)) f.is_efficiency_core = Tristate::True;
      else if (core.count(f.id)) f.is_efficiency_core = Tristate::False;
    }
    return facts;
  }

  uint64_t fmax = 0, fmin = UINT64_MAX;
  bool all_known = true;
  for (const auto& f : facts) {
    if (f.max_frequency_hz == 0) { all_known = false; break; }
    fmax = std::max(fmax, f.max_frequency_hz);
    fmin = std::min(fmin, f.max_frequency_hz);
  }
  if (all_known && fmax > 0 && static_cast<double>(fmin) < static_cast<double>(fmax) * kEfficiencyFreqRatio) {
    const double cut = static_cast<double>(fmax) * kEfficiencyFreqRatio;
    for (auto& f : facts)
      f.is_efficiency_core = static_cast<double>(f.max_frequency_hz) < cut ? Tristate::True : Tristate::False;
  }
  return facts;
}

CoreSet CpuTopologyCollector::present_cores() {
  return read_cpulist_file(kCpuRoot + "/present");
}

CoreSet CpuTopologyCollector::online_cores() {
  return read_cpulist_file(kCpuRoot + "/online");
}

CoreSet CpuTopologyCollector::offline_cores() {
  return read_cpulist_file(kCpuRoot + "/offline");
}

bool CpuTopologyCollector::is_hotpluggable(CoreId id) {
  return util::path_exists(kCpuRoot + "/cpu" + std::to_string(id) + "/online");
}

} // namespace lasso::collectors
