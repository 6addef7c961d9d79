#pragma once
#include "app/Executor.hpp"
#include "model/Priority.hpp"
#include "model/Topology.hpp"

#include <cstdint>
#include <optional>

namespace lasso::app {

// Per-process scheduling knobs. Writes cover every thread of the process.
class IProcessControl {
public:
  virtual ~IProcessControl() = default;

  [[nodiscard]] virtual bool pid_alive(int32_t pid, uint64_t start_time) = 0;

  [[nodiscard]] virtual std::optional<int> get_nice(int32_t pid) = 0;
  [[nodiscard]] virtual std::optional<model::IoPriority> get_io(int32_t pid) = 0;
  [[nodiscard]] virtual std::optional<model::CoreSet> get_affinity(int32_t pid) = 0;

  // Nice and IO class travel together so the executor fallback is one request
  [[nodiscard]] virtual ExecutorResponse set_priority(int32_t pid, int nice, const model::IoPriority& io) = 0;
  [[nodiscard]] virtual ExecutorResponse set_affinity(int32_t pid, const model::CoreSet& cores) = 0;
};

// Direct syscalls; raises that need CAP_SYS_NICE go through the executor.
class SystemProcessControl : public IProcessControl {
public:
  explicit SystemProcessControl(IExecutor* executor) : executor_(executor) {}

  bool pid_alive(int32_t pid, uint64_t start_time) override;
  std::optional<int> get_nice(int32_t pid) override;
  std::optional<model::IoPriority> get_io(int32_t pid) override;
  std::optional<model::CoreSet> get_affinity(int32_t pid) override;
  ExecutorResponse set_priority(int32_t pid, int nice, const model::IoPriority& io) override;
  ExecutorResponse set_affinity(int32_t pid, const model::CoreSet& cores) override;

private:
  IExecutor* executor_{nullptr};
};

} // namespace lasso::app
