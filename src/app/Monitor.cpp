#include "app/Monitor.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <unordered_set>

using namespace std::chrono;

namespace lasso::app {

Monitor::Monitor(collectors::IProcessCollector& procs, RuleStore& rules, RuleApplier& applier,
                 ProBalanceGovernor& governor, ContextFn context)
  : procs_(procs), rules_(rules), applier_(applier), governor_(governor), context_(std::move(context)) {}

Monitor::~Monitor() { stop(); }

void Monitor::start(milliseconds scan_interval) {
  if (thread_.joinable()) return;
  set_scan_interval(scan_interval);
  thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

void Monitor::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void Monitor::scan() {
  if (!procs_.sample(snap_)) {
    LASSO_LOG_WARN("Monitor", "%s: process scan failed", procs_.name());
    return;
  }
  ++scans_;

  const bool all = reapply_all_.exchange(false);
  std::vector<model::ProcessView> targets;
  std::unordered_set<int32_t> alive;
  alive.reserve(snap_.processes.size());
  for (const auto& p : snap_.processes) {
    alive.insert(p.pid);
    auto it = seen_.find(p.pid);
    bool fresh = it == seen_.end() || it->second != p.start_time;
    if (all || fresh) targets.push_back(p);
  }
  seen_.clear();
  for (const auto& p : snap_.processes) seen_.emplace(p.pid, p.start_time);
  applier_.prune(alive);

  if (targets.empty()) return;
  auto rules = rules_.list();
  auto ctx = context_ ? context_() : ApplyContext{};
  auto assignments = apply_rules(rules, targets, ctx);
  if (!assignments.empty()) {
    size_t n = applier_.apply(assignments);
    if (n > 0) LASSO_LOG_DEBUG("Monitor", "applied %zu assignments (%zu writes)", assignments.size(), n);
  }
}

void Monitor::step(steady_clock::time_point now) {
  if (now >= next_scan_) {
    scan();
    next_scan_ = now + milliseconds(scan_interval_ms_.load());
  }
  if (now >= next_gov_) {
    auto cfg = governor_.config();
    model::CpuSnapshot cpu;
    if (cpu_.sample(cpu)) {
      governor_.tick(snap_, cpu.usage_pct);
      ++gov_ticks_;
    }
    next_gov_ = now + cfg.interval;
  }
}

void Monitor::run(std::stop_token st) {
  // Prime CPU deltas so the first governor tick sees real load
  {
    model::CpuSnapshot cpu;
    (void)cpu_.sample(cpu);
  }
  auto now = steady_clock::now();
  next_scan_ = now;
  next_gov_ = now + governor_.config().interval;
  while (!st.stop_requested()) {
    now = steady_clock::now();
    step(now);
    auto wake = std::min(next_scan_, next_gov_);
    auto nap = std::clamp(duration_cast<milliseconds>(wake - steady_clock::now()), 1ms, 100ms);
    std::this_thread::sleep_for(nap);
  }
}

} // namespace lasso::app
