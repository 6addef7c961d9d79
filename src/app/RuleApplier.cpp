#include "app/RuleApplier.hpp"
#include "util/CpuList.hpp"
#include "util/Log.hpp"

namespace lasso::app {

using model::ErrorKind;

bool RuleApplier::apply_one(const model::AffinityAssignment& a, Original& orig) {
  bool wrote = false;
  const char* what = a.source == model::AssignmentSource::Rule ? "rule" : "default";

  if (!a.cores.empty()) {
    auto cur = control_.get_affinity(a.pid);
    if (!cur) return false;  // gone
    if (*cur != a.cores) {
      if (!orig.affinity) orig.affinity = *cur;
      auto resp = control_.set_affinity(a.pid, a.cores);
      if (resp.ok()) {
        orig.affinity_changed = true;
        wrote = true;
        LASSO_LOG_INFO("Rules", "%s %s: %s(%d) affinity %s", what, a.rule_id.c_str(), a.process_name.c_str(), a.pid,
                       util::format_cpulist(a.cores).c_str());
      } else {
        report_failure("Rules", resp, "affinity for " + a.process_name + "(" + std::to_string(a.pid) + ")");
        if (resp.error == ErrorKind::TargetNotFound) return wrote;
      }
    }
  }

  if (a.nice || a.io) {
    if (holder_) {
      if (auto prev = holder_->defer_priority(a.pid, a.nice, a.io)) {
        if (!orig.nice) {
          auto cur_io = control_.get_io(a.pid);
          if (!prev->io && !cur_io) return wrote;
          orig.nice = prev->nice;
          orig.io = prev->io ? *prev->io : *cur_io;
        }
        orig.priority_changed = true;
        return wrote;
      }
    }
    auto cur_nice = control_.get_nice(a.pid);
    auto cur_io = control_.get_io(a.pid);
    if (!cur_nice || !cur_io) return wrote;
    int nice = a.nice.value_or(*cur_nice);
    model::IoPriority io = a.io.value_or(*cur_io);
    if (nice != *cur_nice || !(io == *cur_io)) {
      if (!orig.nice) { orig.nice = *cur_nice; orig.io = *cur_io; }
      auto resp = control_.set_priority(a.pid, nice, io);
      if (resp.ok()) {
        orig.priority_changed = true;
        wrote = true;
        LASSO_LOG_INFO("Rules", "%s %s: %s(%d) nice %d io %s", what, a.rule_id.c_str(), a.process_name.c_str(), a.pid,
                       nice, model::to_string(io).c_str());
      } else {
        report_failure("Rules", resp, "priority for " + a.process_name + "(" + std::to_string(a.pid) + ")");
      }
    }
  }
  return wrote;
}

size_t RuleApplier::apply(const std::vector<model::AffinityAssignment>& assignments) {
  size_t n = 0;
  for (const auto& a : assignments) {
    std::lock_guard<std::mutex> pid_lk(locks_.for_pid(a.pid));
    Original orig;
    bool had = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = originals_.find(a.pid);
      if (it != originals_.end()) { orig = it->second; had = true; }
    }
    bool wrote = apply_one(a, orig);
    if (orig.affinity_changed || orig.priority_changed) {
      std::lock_guard<std::mutex> lk(mu_);
      // A restore_all that took the entry meanwhile restores this pid after us
      if (!had || originals_.count(a.pid)) originals_[a.pid] = orig;
    }
    if (wrote) ++n;
  }
  return n;
}

size_t RuleApplier::restore_all() {
  std::unordered_map<int32_t, Original> todo;
  {
    std::lock_guard<std::mutex> lk(mu_);
    todo.swap(originals_);
  }
  size_t n = 0;
  for (auto& [pid, orig] : todo) {
    std::lock_guard<std::mutex> pid_lk(locks_.for_pid(pid));
    bool ok = true;
    if (orig.affinity_changed && orig.affinity) {
      auto resp = control_.set_affinity(pid, *orig.affinity);
      if (!resp.ok()) { report_failure("Rules", resp, "restore affinity of pid " + std::to_string(pid)); ok = false; }
    }
    if (orig.priority_changed && orig.nice && orig.io) {
      // A throttled process gets its original back when the governor lets go
      bool deferred = holder_ && holder_->defer_priority(pid, orig.nice, orig.io);
      if (!deferred) {
        auto resp = control_.set_priority(pid, *orig.nice, *orig.io);
        if (!resp.ok()) { report_failure("Rules", resp, "restore priority of pid " + std::to_string(pid)); ok = false; }
      }
    }
    if (ok) ++n;
  }
  LASSO_LOG_INFO("Rules", "restored %zu of %zu processes", n, todo.size());
  return n;
}

void RuleApplier::prune(const std::unordered_set<int32_t>& alive) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = originals_.begin(); it != originals_.end();) {
    if (!alive.count(it->first)) it = originals_.erase(it); else ++it;
  }
}

size_t RuleApplier::touched_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return originals_.size();
}

} // namespace lasso::app
