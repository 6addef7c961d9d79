#pragma once
#include "model/Topology.hpp"

namespace lasso::collectors {

// Read-only view of core online state, so the parking controller can be
// driven against a fake in tests.
class ICoreProbe {
public:
  virtual ~ICoreProbe() = default;

  [[nodiscard]] virtual model::CoreSet online_cores() = 0;
  [[nodiscard]] virtual model::CoreSet offline_cores() = 0;

  // True when the core exposes an online control file. CPU 0 usually does not.
  [[nodiscard]] virtual bool is_hotpluggable(model::CoreId id) = 0;
};

} // namespace lasso::collectors
