#pragma once
#include <cstdint>
#include <vector>

namespace lasso::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSnapshot {
  CpuTimes total_times{};
  double usage_pct{};                // aggregate busy percent 0..100
  std::vector<double> per_core_pct;  // indexed by position in /proc/stat, online cores only
  int online_cores{0};
};

} // namespace lasso::model
