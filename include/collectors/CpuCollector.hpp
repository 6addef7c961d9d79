#pragma once
#include "model/Cpu.hpp"

namespace lasso::collectors {

class CpuCollector {
public:
  CpuCollector() = default;
  bool sample(model::CpuSnapshot& out);

  // Aggregate and per-core jiffies from /proc/stat. False if unreadable.
  static bool read_stat(model::CpuTimes& agg, std::vector<model::CpuTimes>& per);
private:
  model::CpuTimes last_total_{};
  std::vector<model::CpuTimes> last_per_{};
  bool has_last_{false};
};

} // namespace lasso::collectors
