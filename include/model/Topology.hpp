#pragma once
#include <cstdint>
#include <set>
#include <string>

namespace lasso::model {

// Logical CPU index as enumerated by the kernel; stable for a boot session.
using CoreId = int;
using CoreSet = std::set<CoreId>;

enum class Tristate { Unknown, False, True };

// Static per-core attributes read once at boot.
struct CoreFact {
  CoreId id{-1};
  uint64_t max_frequency_hz{0};      // 0 = unknown
  int cache_group_id{-1};            // last-level cache domain; -1 = unknown
  uint64_t cache_group_size_bytes{0};
  Tristate is_efficiency_core{Tristate::Unknown};
};

enum class ClassificationReason { CacheAsymmetricCCD, HybridPCoreECore, Uniform };

// Result of one classification pass. preferred and non_preferred are disjoint;
// when has_asymmetry is false both are empty and Gaming Mode is unsupported.
struct Topology {
  CoreSet preferred;
  CoreSet non_preferred;
  bool has_asymmetry{false};
  ClassificationReason reason{ClassificationReason::Uniform};
  std::string description;
};

[[nodiscard]] const char* to_string(ClassificationReason r);

} // namespace lasso::model
