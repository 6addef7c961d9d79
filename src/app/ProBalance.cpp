#include "app/ProBalance.hpp"
#include "util/Log.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>

namespace lasso::app {

using model::ErrorKind;
using model::IoClass;
using model::IoPriority;
using model::ProcessPriorityState;

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

ProBalanceGovernor::ProBalanceGovernor(IProcessControl& control, PidLockTable& locks, GovernorConfig cfg)
  : control_(control), locks_(locks), own_pid_(static_cast<int32_t>(::getpid())), cfg_(std::move(cfg)) {}

void ProBalanceGovernor::set_config(GovernorConfig cfg) {
  std::lock_guard<std::mutex> lk(cfg_mu_);
  cfg_ = std::move(cfg);
}

GovernorConfig ProBalanceGovernor::config() const {
  std::lock_guard<std::mutex> lk(cfg_mu_);
  return cfg_;
}

std::vector<ProcessPriorityState> ProBalanceGovernor::status() const {
  std::vector<ProcessPriorityState> v;
  {
    std::lock_guard<std::mutex> lk(pub_mu_);
    v = published_;
  }
  // Restore targets move between ticks when rules are deferred
  std::lock_guard<std::mutex> lk(held_mu_);
  for (auto& st : v) {
    auto h = held_.find(st.pid);
    if (h == held_.end()) continue;
    st.original_nice = h->second.nice;
    if (h->second.io) st.original_io = *h->second.io;
  }
  return v;
}

void ProBalanceGovernor::publish() {
  std::vector<ProcessPriorityState> v;
  v.reserve(throttled_.size());
  for (const auto& [pid, st] : throttled_) v.push_back(st);
  std::sort(v.begin(), v.end(), [](const auto& a, const auto& b) { return a.pid < b.pid; });
  std::lock_guard<std::mutex> lk(pub_mu_);
  published_ = std::move(v);
}

bool ProBalanceGovernor::is_exempt(const model::ProcessView& p) const {
  // Ourselves, init, kthreadd and every kernel thread
  if (p.pid == own_pid_ || p.pid <= 2 || p.ppid == 2) return true;
  auto name = lower(p.name);
  std::lock_guard<std::mutex> lk(cfg_mu_);
  for (const auto& e : cfg_.exempt) {
    if (!e.empty() && name.find(lower(e)) != std::string::npos) return true;
  }
  return false;
}

std::optional<PriorityTarget> ProBalanceGovernor::defer_priority(int32_t pid, std::optional<int> nice,
                                                                  std::optional<IoPriority> io) {
  std::lock_guard<std::mutex> lk(held_mu_);
  auto it = held_.find(pid);
  if (it == held_.end()) return std::nullopt;
  PriorityTarget prev = it->second;
  if (nice) it->second.nice = *nice;
  if (io) it->second.io = *io;
  LASSO_LOG_DEBUG("ProBalance", "pid %d is throttled; priority change deferred to restore", pid);
  return prev;
}

void ProBalanceGovernor::release(int32_t pid) {
  std::lock_guard<std::mutex> lk(held_mu_);
  held_.erase(pid);
}

bool ProBalanceGovernor::restore_one(const ProcessPriorityState& st, ErrorKind& err, int& nice_out) {
  std::lock_guard<std::mutex> pid_lk(locks_.for_pid(st.pid));
  PriorityTarget target{st.original_nice, st.io_changed ? std::optional<IoPriority>(st.original_io) : std::nullopt};
  {
    std::lock_guard<std::mutex> lk(held_mu_);
    if (auto it = held_.find(st.pid); it != held_.end()) target = it->second;
  }
  IoPriority io;
  if (target.io) {
    io = *target.io;
  } else {
    auto cur = control_.get_io(st.pid);
    if (!cur) { err = ErrorKind::TargetNotFound; release(st.pid); return false; }
    io = *cur;
  }
  auto resp = control_.set_priority(st.pid, target.nice, io);
  err = resp.error;
  if (resp.ok() || resp.error == ErrorKind::TargetNotFound) release(st.pid);
  if (!resp.ok()) report_failure("ProBalance", resp, "restore " + st.name + "(" + std::to_string(st.pid) + ")");
  nice_out = target.nice;
  return resp.ok();
}

GovernorTick ProBalanceGovernor::tick(const model::ProcessSnapshot& snap, double system_load_pct) {
  std::lock_guard<std::mutex> tick_lk(tick_mu_);
  GovernorTick out;
  GovernorConfig cfg = config();
  if (!cfg.enabled) {
    // Turning the governor off gives back everything it took
    if (!throttled_.empty()) out.restored = restore_locked();
    high_.clear();
    return out;
  }

  std::unordered_map<int32_t, const model::ProcessView*> by_pid;
  by_pid.reserve(snap.processes.size());
  for (const auto& p : snap.processes) by_pid.emplace(p.pid, &p);

  // Forget exited processes and reused pids
  for (auto it = throttled_.begin(); it != throttled_.end();) {
    auto f = by_pid.find(it->first);
    if (f == by_pid.end() || f->second->start_time != it->second.start_time) {
      LASSO_LOG_DEBUG("ProBalance", "%s(%d) exited while throttled", it->second.name.c_str(), it->first);
      release(it->first);
      it = throttled_.erase(it);
      ++out.pruned;
    } else {
      ++it;
    }
  }
  for (auto it = high_.begin(); it != high_.end();) {
    auto f = by_pid.find(it->first);
    if (f == by_pid.end() || f->second->start_time != it->second.start_time) it = high_.erase(it); else ++it;
  }

  const bool busy = system_load_pct > cfg.load_threshold_pct;
  for (const auto& p : snap.processes) {
    if (is_exempt(p)) continue;

    auto t = throttled_.find(p.pid);
    if (t != throttled_.end()) {
      auto& st = t->second;
      if (p.cpu_pct < cfg.restore_threshold_pct) {
        if (++st.low_ticks >= cfg.restore_hold_ticks) {
          ErrorKind err = ErrorKind::None;
          int back_to = st.original_nice;
          if (restore_one(st, err, back_to) || err == ErrorKind::TargetNotFound) {
            if (err == ErrorKind::None) {
              LASSO_LOG_INFO("ProBalance", "restore %s(%d) cpu=%.1f%% nice %d->%d", st.name.c_str(), p.pid,
                             p.cpu_pct, st.current_nice, back_to);
              ++out.restored;
            }
            throttled_.erase(t);
          }
        }
      } else {
        st.low_ticks = 0;
      }
      continue;
    }

    auto& hc = high_[p.pid];
    hc.start_time = p.start_time;
    if (p.cpu_pct > cfg.throttle_threshold_pct) {
      hc.ticks = std::min(hc.ticks + 1, cfg.sustain_ticks);
    } else {
      hc.ticks = std::max(0, hc.ticks - 1);
    }
    if (hc.ticks < cfg.sustain_ticks || !busy) continue;

    // Read what the process has now, not what the scan saw: a rule may have
    // written in between, and that value is what a restore must return to.
    int cur_nice = 0, new_nice = 0;
    std::optional<IoPriority> cur_io;
    bool io_changed = false;
    ExecutorResponse resp;
    {
      std::lock_guard<std::mutex> pid_lk(locks_.for_pid(p.pid));
      auto n = control_.get_nice(p.pid);
      cur_io = control_.get_io(p.pid);
      if (!n || !cur_io) { high_.erase(p.pid); continue; }
      cur_nice = *n;
      new_nice = std::min(std::min(cur_nice + cfg.nice_step, cfg.nice_ceiling), model::kNiceMax);
      if (new_nice <= cur_nice) continue;  // already at or past the ceiling

      IoPriority target_io = *cur_io;
      if (cfg.throttle_io && !(cur_io->io_class == IoClass::Idle)) {
        target_io = IoPriority{IoClass::BestEffort, 7};
        io_changed = !(target_io == *cur_io);
      }
      resp = control_.set_priority(p.pid, new_nice, target_io);
      if (resp.ok()) {
        std::lock_guard<std::mutex> lk(held_mu_);
        held_[p.pid] = PriorityTarget{cur_nice, io_changed ? cur_io : std::nullopt};
      }
    }
    if (!resp.ok()) {
      report_failure("ProBalance", resp, "throttle " + p.name + "(" + std::to_string(p.pid) + ")");
      if (resp.error == ErrorKind::TargetNotFound) high_.erase(p.pid);
      continue;
    }

    ProcessPriorityState st;
    st.pid = p.pid;
    st.start_time = p.start_time;
    st.name = p.name;
    st.original_nice = cur_nice;
    st.current_nice = new_nice;
    st.original_io = *cur_io;
    st.io_changed = io_changed;
    st.throttled_since = std::chrono::steady_clock::now();
    throttled_.emplace(p.pid, std::move(st));
    high_.erase(p.pid);
    ++out.throttled;
    LASSO_LOG_INFO("ProBalance", "throttle %s(%d) cpu=%.1f%% load=%.1f%% nice %d->%d", p.name.c_str(), p.pid,
                   p.cpu_pct, system_load_pct, cur_nice, new_nice);
  }

  publish();
  return out;
}

size_t ProBalanceGovernor::restore_all() {
  std::lock_guard<std::mutex> tick_lk(tick_mu_);
  return restore_locked();
}

size_t ProBalanceGovernor::restore_locked() {
  size_t n = 0;
  for (const auto& [pid, st] : throttled_) {
    ErrorKind err = ErrorKind::None;
    int back_to = st.original_nice;
    if (restore_one(st, err, back_to)) ++n;
  }
  throttled_.clear();
  high_.clear();
  {
    std::lock_guard<std::mutex> lk(held_mu_);
    held_.clear();
  }
  publish();
  return n;
}

} // namespace lasso::app
