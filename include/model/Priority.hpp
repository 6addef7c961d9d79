#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lasso::model {

// Linux I/O scheduling classes (ioprio_set)
enum class IoClass : int { None = 0, RealTime = 1, BestEffort = 2, Idle = 3 };

struct IoPriority {
  IoClass io_class{IoClass::None};
  int level{0};  // 0..7, ignored for None and Idle

  bool operator==(const IoPriority&) const = default;
};

// "none", "rt:L", "be:L", "idle"
[[nodiscard]] std::string to_string(const IoPriority& p);
[[nodiscard]] std::optional<IoPriority> parse_io_priority(const std::string& s);

inline constexpr int kNiceMin = -20;
inline constexpr int kNiceMax = 19;

// Governor bookkeeping for one throttled process. Exists only while the
// throttle is in effect and the process is alive.
struct ProcessPriorityState {
  int32_t pid{};
  uint64_t start_time{};
  std::string name;
  int original_nice{};
  int current_nice{};
  IoPriority original_io{};
  bool io_changed{false};
  std::chrono::steady_clock::time_point throttled_since{};
  int low_ticks{0};  // consecutive ticks below the restore threshold
};

} // namespace lasso::model
