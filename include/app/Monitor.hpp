#pragma once
#include "app/ProBalance.hpp"
#include "app/RuleApplier.hpp"
#include "app/RuleEngine.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/IProcessCollector.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>
#include <unordered_map>

namespace lasso::app {

// Background loop: scans /proc on one cadence (rules for new processes) and
// ticks the governor on another.
class Monitor {
public:
  using ContextFn = std::function<ApplyContext()>;

  Monitor(collectors::IProcessCollector& procs, RuleStore& rules, RuleApplier& applier,
          ProBalanceGovernor& governor, ContextFn context);
  ~Monitor();

  void start(std::chrono::milliseconds scan_interval);
  void stop();

  // Run whatever is due at now. Used by the thread and by --run --iterations.
  void step(std::chrono::steady_clock::time_point now);

  // Next scan re-applies rules to every process, not just new ones
  void request_reapply() { reapply_all_.store(true); }

  void set_scan_interval(std::chrono::milliseconds iv) { scan_interval_ms_.store(iv.count()); }

  [[nodiscard]] size_t scans() const { return scans_.load(); }
  [[nodiscard]] size_t governor_ticks() const { return gov_ticks_.load(); }

private:
  void run(std::stop_token st);
  void scan();

  collectors::IProcessCollector& procs_;
  RuleStore& rules_;
  RuleApplier& applier_;
  ProBalanceGovernor& governor_;
  ContextFn context_;
  collectors::CpuCollector cpu_{};

  std::jthread thread_{};
  std::atomic<bool> reapply_all_{true};
  std::atomic<long long> scan_interval_ms_{500};
  std::atomic<size_t> scans_{0};
  std::atomic<size_t> gov_ticks_{0};

  model::ProcessSnapshot snap_{};
  std::unordered_map<int32_t, uint64_t> seen_;  // pid -> start_time
  std::chrono::steady_clock::time_point next_scan_{};
  std::chrono::steady_clock::time_point next_gov_{};
};

} // namespace lasso::app
