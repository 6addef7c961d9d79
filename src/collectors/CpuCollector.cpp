#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string>
#include <string_view>

namespace lasso::collectors {

static void parse_cpu_line(std::string_view line, model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

bool CpuCollector::read_stat(model::CpuTimes& agg, std::vector<model::CpuTimes>& per) {
  auto txt_opt = util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  per.clear();
  size_t start = 0; bool after_cpu = false;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); after_cpu = true; }
    else if (after_cpu && line.starts_with("cpu")) { model::CpuTimes t{}; parse_cpu_line(line, t); per.push_back(t); }
    else if (after_cpu) break;
    start = end + 1;
  }
  return after_cpu;
}

bool CpuCollector::sample(model::CpuSnapshot& out) {
  model::CpuTimes agg{}; std::vector<model::CpuTimes> per;
  if (!read_stat(agg, per)) return false;
  // Offline cores drop out of /proc/stat, so per-core deltas are only
  // meaningful while the core count is unchanged.
  double usage = 0.0; std::vector<double> per_pct(per.size(), 0.0);
  if (has_last_) {
    auto td = agg.total() - last_total_.total();
    auto wd = agg.work()  - last_total_.work();
    usage = (td > 0) ? (100.0 * static_cast<double>(wd) / static_cast<double>(td)) : 0.0;
    if (per.size() == last_per_.size()) {
      for (size_t i = 0; i < per.size(); ++i) {
        auto tdi = per[i].total() - last_per_[i].total();
        auto wdi = per[i].work()  - last_per_[i].work();
        per_pct[i] = (tdi > 0) ? (100.0 * static_cast<double>(wdi) / static_cast<double>(tdi)) : 0.0;
      }
    }
  }
  last_total_ = agg; last_per_ = per; has_last_ = true;
  out.total_times = agg; out.usage_pct = usage; out.per_core_pct = std::move(per_pct);
  out.online_cores = static_cast<int>(out.per_core_pct.size());
  if (out.online_cores <= 0) out.online_cores = 1;
  return true;
}

} // namespace lasso::collectors
