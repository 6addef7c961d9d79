#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace lasso::model {

// One live process as seen by a single /proc scan.
struct ProcessView {
  int32_t pid{};
  int32_t ppid{};
  uint64_t start_time{};  // jiffies since boot; disambiguates pid reuse
  uint64_t total_time{};  // utime+stime, jiffies
  double cpu_pct{};       // share since previous scan, 100 = one full core
  int nice{};
  std::string comm;       // kernel comm (max 15 chars)
  std::string name;       // resolved display/match name
};

struct ProcessSnapshot {
  std::vector<ProcessView> processes;
  unsigned ncpu{1};
};

} // namespace lasso::model
