#include "collectors/ProcessCollector.hpp"
#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <unordered_set>

namespace lasso::collectors {

bool ProcessCollector::parse_stat_line(const std::string& content, StatFields& out) {
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp) return false;
  if (rp + 2 > content.size()) return false;
  out.comm = content.substr(lp + 1, rp - lp - 1);
  std::istringstream ss(content.substr(rp + 2));
  char state = '?';
  ss >> state;
  ss >> out.ppid;
  // pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
  for (int i = 0; i < 9; i++) { std::string tmp; ss >> tmp; }
  ss >> out.utime >> out.stime;
  // cutime cstime priority
  for (int i = 0; i < 3; i++) { std::string tmp; ss >> tmp; }
  ss >> out.nice;
  // num_threads itrealvalue
  for (int i = 0; i < 2; i++) { std::string tmp; ss >> tmp; }
  ss >> out.start_time;
  return !ss.fail();
}

std::string ProcessCollector::read_argv0(int32_t pid) {
  auto bytes = util::read_file_bytes(std::string("/proc/") + std::to_string(pid) + "/cmdline");
  if (!bytes) return {};
  std::string out;
  for (auto b : *bytes) {
    if (b == 0) break;
    out.push_back(static_cast<char>(b));
  }
  return out;
}

static bool ends_with_exe(const std::string& s) {
  if (s.size() < 4) return false;
  std::string tail = s.substr(s.size() - 4);
  for (auto& c : tail) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return tail == ".exe";
}

std::string ProcessCollector::resolve_name(const std::string& comm, const std::string& argv0) {
  if (argv0.empty()) return comm;
  // Wine/Proton: comm is often "Main" while argv[0] is a Windows path
  if (argv0.find('\\') != std::string::npos && ends_with_exe(argv0)) {
    std::string p = argv0;
    std::replace(p.begin(), p.end(), '\\', '/');
    while (!p.empty() && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    std::string base = slash == std::string::npos ? p : p.substr(slash + 1);
    if (!base.empty()) return base;
  }
  // The kernel caps comm at 15 chars
  if (comm.size() == 15) {
    auto slash = argv0.rfind('/');
    std::string base = slash == std::string::npos ? argv0 : argv0.substr(slash + 1);
    if (base.size() > 15) return base;
  }
  return comm;
}

bool ProcessCollector::sample(model::ProcessSnapshot& out) {
  model::CpuTimes agg{}; std::vector<model::CpuTimes> per;
  if (!CpuCollector::read_stat(agg, per)) return false;
  uint64_t cpu_total = agg.total();
  if (!per.empty()) ncpu_ = static_cast<unsigned>(per.size());
  if (ncpu_ == 0) ncpu_ = 1;

  out.processes.clear();
  out.ncpu = ncpu_;
  std::unordered_set<int32_t> alive;

  for (auto& entry : util::list_dir("/proc")) {
    if (entry.empty() || entry[0] < '0' || entry[0] > '9') continue;
    int32_t pid = 0;
    auto [ptr, ec] = std::from_chars(entry.data(), entry.data() + entry.size(), pid);
    if (ec != std::errc{} || ptr != entry.data() + entry.size()) continue;
    // The process may exit between readdir and read; skip it silently
    auto content = util::read_file_string(std::string("/proc/") + entry + "/stat");
    if (!content) continue;
    StatFields sf;
    if (!parse_stat_line(*content, sf)) continue;

    model::ProcessView pv;
    pv.pid = pid; pv.ppid = sf.ppid; pv.nice = sf.nice;
    pv.start_time = sf.start_time;
    pv.total_time = sf.utime + sf.stime;
    pv.comm = sf.comm;
    if (have_last_) {
      auto it = last_per_proc_.find(pid);
      // A reused pid starts from zero rather than the previous owner's total
      uint64_t lastp = pv.total_time;
      if (it != last_per_proc_.end() && it->second.start_time == pv.start_time) lastp = it->second.total_time;
      uint64_t dp = (pv.total_time > lastp) ? (pv.total_time - lastp) : 0;
      uint64_t dt = (cpu_total > last_cpu_total_) ? (cpu_total - last_cpu_total_) : 0;
      if (dt > 0) pv.cpu_pct = (100.0 * static_cast<double>(dp) / static_cast<double>(dt)) * static_cast<double>(ncpu_);
    }

    auto nit = names_.find(pid);
    if (nit != names_.end() && nit->second.first == pv.start_time) {
      pv.name = nit->second.second;
    } else {
      pv.name = resolve_name(pv.comm, read_argv0(pid));
      names_[pid] = {pv.start_time, pv.name};
    }
    alive.insert(pid);
    out.processes.push_back(std::move(pv));
  }

  last_per_proc_.clear();
  for (const auto& p : out.processes) last_per_proc_[p.pid] = Seen{p.start_time, p.total_time};
  for (auto it = names_.begin(); it != names_.end();) {
    if (!alive.count(it->first)) it = names_.erase(it); else ++it;
  }
  last_cpu_total_ = cpu_total; have_last_ = true;
  return true;
}

} // namespace lasso::collectors
