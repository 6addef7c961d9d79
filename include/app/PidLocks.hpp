#pragma once
#include "model/Priority.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>

namespace lasso::app {

// Serializes priority/affinity writes per process. The rule applier and the
// governor both take the stripe for a pid before touching it.
class PidLockTable {
public:
  static constexpr size_t kStripes = 64;

  std::mutex& for_pid(int32_t pid) {
    return stripes_[static_cast<uint32_t>(pid) % kStripes];
  }

private:
  std::array<std::mutex, kStripes> stripes_{};
};

// Priority a holder puts back when it lets go of a process.
struct PriorityTarget {
  int nice{0};
  std::optional<model::IoPriority> io;  // nullopt: I/O priority was never changed
};

// A component that owns some processes' priority outright. While it holds a
// pid, other writers must not touch nice/ioprio; they hand over the value
// they want instead and it is applied on release.
class IPriorityHolder {
public:
  virtual ~IPriorityHolder() = default;

  // Caller holds the pid's stripe lock. If pid is held, replace the given
  // fields of its release target and return the previous target; otherwise
  // nullopt and the caller writes directly.
  virtual std::optional<PriorityTarget> defer_priority(int32_t pid, std::optional<int> nice,
                                                       std::optional<model::IoPriority> io) = 0;
};

} // namespace lasso::app
