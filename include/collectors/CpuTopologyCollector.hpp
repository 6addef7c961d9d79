#pragma once
#include "collectors/ICoreProbe.hpp"
#include "model/Topology.hpp"
#include <vector>

namespace lasso::collectors {

// Reads per-core facts from /sys/devices/system/cpu (remappable through
// LASSO_SYS_ROOT). Offline cores have no cache directory, so facts for them
// come back with an unknown cache group.
class CpuTopologyCollector : public ICoreProbe {
public:
  CpuTopologyCollector() = default;

  [[nodiscard]] std::vector<model::CoreFact> collect();

  model::CoreSet present_cores();
  model::CoreSet online_cores() override;
  model::CoreSet offline_cores() override;
  bool is_hotpluggable(model::CoreId id) override;

  // Below this share of the fastest core's max frequency a core is treated as
  // an efficiency core when the kernel exposes no hybrid PMU lists.
  static constexpr double kEfficiencyFreqRatio = 0.80;
};

} // namespace lasso::collectors
