#pragma once
#include "model/Process.hpp"

namespace lasso::collectors {

// Source of per-process views. The /proc scanner is the only production
// implementation; tests feed scripted snapshots through it.
class IProcessCollector {
public:
  virtual ~IProcessCollector() = default;

  // Sample current process state into out. Return true on success.
  [[nodiscard]] virtual bool sample(model::ProcessSnapshot& out) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace lasso::collectors
