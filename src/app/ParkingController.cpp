#include "app/ParkingController.hpp"
#include "util/CpuList.hpp"
#include "util/Log.hpp"

#include <algorithm>

namespace lasso::app {

using model::CoreId;
using model::CoreSet;
using model::ErrorKind;
using model::ParkOutcome;
using model::ParkPhase;
using model::ParkResult;
using model::ParkState;

ParkingController::ParkingController(IExecutor& executor, collectors::ICoreProbe& probe)
  : executor_(executor), probe_(probe) {}

ParkState ParkingController::current_state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

bool ParkingController::wait_settled(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [&] { return state_.settled(); });
}

void ParkingController::subscribe(Listener l) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.push_back(std::move(l));
}

void ParkingController::publish(const ParkState& s) {
  cv_.notify_all();
  std::vector<Listener> copy;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    copy = listeners_;
  }
  for (auto& l : copy) l(s);
}

CoreSet ParkingController::unpark_cores(const std::vector<CoreId>& cores, ExecutorResponse& last_error) {
  CoreSet still_offline;
  for (auto it = cores.rbegin(); it != cores.rend(); ++it) {
    auto resp = executor_.execute(ExecutorRequest::unpark(*it));
    if (resp.ok()) continue;
    if (resp.error == ErrorKind::TargetNotFound) {
      // Core vanished; nothing left to restore
      report_failure("Parking", resp, "unpark cpu" + std::to_string(*it));
      continue;
    }
    report_failure("Parking", resp, "unpark cpu" + std::to_string(*it));
    still_offline.insert(*it);
    last_error = resp;
  }
  return still_offline;
}

ParkResult ParkingController::finish_unpark(std::unique_lock<std::mutex>& lk, const CoreSet& still_offline,
                                            const ExecutorResponse& last_error, ParkOutcome on_success) {
  lk.lock();
  state_.parked = still_offline;
  if (still_offline.empty()) {
    state_.phase = ParkPhase::Unparked;
    state_.error = ErrorKind::None;
    state_.reason.clear();
  } else {
    state_.phase = ParkPhase::Failed;
    state_.error = last_error.error;
    state_.reason = "cpus " + util::format_cpulist(still_offline) + " could not be restored: " + last_error.detail;
  }
  cancel_requested_ = false;
  ParkState snap = state_;
  lk.unlock();
  publish(snap);
  if (snap.phase == ParkPhase::Unparked) {
    LASSO_LOG_INFO("Parking", "all cores online");
    return {on_success, snap};
  }
  LASSO_LOG_ERROR("Parking", "%s", snap.reason.c_str());
  return {ParkOutcome::Failed, snap};
}

ParkResult ParkingController::enable(const model::Topology& topo) {
  std::unique_lock<std::mutex> lk(mu_);
  if (state_.phase == ParkPhase::Parked || state_.phase == ParkPhase::Parking)
    return {ParkOutcome::AlreadyInState, state_};
  if (state_.phase == ParkPhase::Unparking)
    return {ParkOutcome::InProgress, state_};
  if (!topo.has_asymmetry) {
    LASSO_LOG_INFO("Parking", "enable refused: %s", model::remediation_hint(ErrorKind::Unsupported));
    return {ParkOutcome::Unsupported, state_};
  }

  CoreSet online = probe_.online_cores();
  CoreSet offline = probe_.offline_cores();
  CoreSet adopted;
  std::vector<CoreId> plan;
  for (CoreId c : topo.non_preferred) {
    if (topo.preferred.count(c)) continue;  // never park a preferred core
    if (offline.count(c) && !state_.parked.count(c)) { adopted.insert(c); continue; }
    if (!online.count(c)) continue;
    if (!probe_.is_hotpluggable(c)) {
      LASSO_LOG_WARN("Parking", "cpu%d cannot be taken offline, skipping", c);
      continue;
    }
    plan.push_back(c);
  }
  // Cores a previous failed run left offline stay tracked
  for (CoreId c : state_.parked) if (offline.count(c)) adopted.insert(c);

  size_t remaining_online = 0;
  for (CoreId c : online)
    if (std::find(plan.begin(), plan.end(), c) == plan.end()) ++remaining_online;
  if (remaining_online == 0) {
    state_.phase = ParkPhase::Failed;
    state_.error = ErrorKind::InvalidRequest;
    state_.reason = "parking cpus " + util::format_cpulist(CoreSet(plan.begin(), plan.end())) + " would leave no core online";
    state_.parked = adopted;
    ParkState snap = state_;
    lk.unlock();
    publish(snap);
    LASSO_LOG_ERROR("Parking", "%s", snap.reason.c_str());
    return {ParkOutcome::Failed, snap};
  }
  if (plan.empty() && adopted.empty()) {
    LASSO_LOG_INFO("Parking", "enable refused: no non-preferred core can be taken offline");
    return {ParkOutcome::Unsupported, state_};
  }

  state_.phase = ParkPhase::Parking;
  state_.error = ErrorKind::None;
  state_.reason.clear();
  state_.parked = adopted;
  cancel_requested_ = false;
  ParkState snap = state_;
  lk.unlock();
  publish(snap);
  LASSO_LOG_INFO("Parking", "parking cpus %s (%s)", util::format_cpulist(CoreSet(plan.begin(), plan.end())).c_str(),
                 topo.description.c_str());

  std::vector<CoreId> done;
  ExecutorResponse failure;
  bool cancelled = false;
  for (CoreId c : plan) {
    // The cancel check and claiming the write are one step under mu_
    lk.lock();
    cancelled = cancel_requested_;
    if (!cancelled) {
      park_in_flight_ = true;
      parking_thread_ = std::this_thread::get_id();
    }
    lk.unlock();
    if (cancelled) break;

    auto resp = executor_.execute(ExecutorRequest::park(c));
    lk.lock();
    park_in_flight_ = false;
    if (resp.ok()) state_.parked.insert(c);
    snap = state_;
    lk.unlock();
    cv_.notify_all();
    if (!resp.ok()) {
      report_failure("Parking", resp, "park cpu" + std::to_string(c));
      failure = resp;
      break;
    }
    done.push_back(c);
    publish(snap);
  }
  if (!cancelled && failure.ok()) {
    // A disable() that arrived during the last write still wins
    lk.lock();
    cancelled = cancel_requested_;
    lk.unlock();
  }

  if (cancelled) {
    lk.lock();
    state_.phase = ParkPhase::Unparking;
    std::vector<CoreId> all(state_.parked.begin(), state_.parked.end());
    snap = state_;
    lk.unlock();
    publish(snap);
    LASSO_LOG_INFO("Parking", "enable cancelled, restoring %zu cores", all.size());
    ExecutorResponse last;
    // Ours newest-first, then adopted ones
    std::vector<CoreId> order;
    for (CoreId c : all) if (std::find(done.begin(), done.end(), c) == done.end()) order.push_back(c);
    for (CoreId c : done) order.push_back(c);
    auto still = unpark_cores(order, last);
    return finish_unpark(lk, still, last, ParkOutcome::Cancelled);
  }

  if (!failure.ok()) {
    // Roll back only what this call took offline
    ExecutorResponse last = failure;
    auto still = unpark_cores(done, last);
    lk.lock();
    for (CoreId c : done) if (!still.count(c)) state_.parked.erase(c);
    state_.phase = ParkPhase::Failed;
    state_.error = failure.error;
    state_.reason = failure.detail;
    cancel_requested_ = false;
    snap = state_;
    lk.unlock();
    publish(snap);
    LASSO_LOG_ERROR("Parking", "enable failed, rolled back: %s", snap.reason.c_str());
    return {ParkOutcome::Failed, snap};
  }

  lk.lock();
  state_.phase = ParkPhase::Parked;
  snap = state_;
  lk.unlock();
  publish(snap);
  LASSO_LOG_INFO("Parking", "parked cpus %s", util::format_cpulist(snap.parked).c_str());
  return {ParkOutcome::Done, snap};
}

ParkResult ParkingController::disable() {
  std::unique_lock<std::mutex> lk(mu_);
  switch (state_.phase) {
    case ParkPhase::Unparked:
      return {ParkOutcome::AlreadyInState, state_};
    case ParkPhase::Unparking:
      return {ParkOutcome::InProgress, state_};
    case ParkPhase::Parking: {
      cancel_requested_ = true;
      // Let a park already handed to the executor finish. Called from inside
      // that write (a listener or the executor itself), there is nothing to wait for.
      if (parking_thread_ != std::this_thread::get_id())
        cv_.wait(lk, [&] { return !park_in_flight_; });
      ParkState snap = state_;
      lk.unlock();
      LASSO_LOG_INFO("Parking", "disable requested during enable; cancelling");
      return {ParkOutcome::InProgress, snap};
    }
    case ParkPhase::Parked:
    case ParkPhase::Failed:
      break;
  }
  state_.phase = ParkPhase::Unparking;
  std::vector<CoreId> cores(state_.parked.begin(), state_.parked.end());
  ParkState snap = state_;
  lk.unlock();
  publish(snap);
  LASSO_LOG_INFO("Parking", "unparking cpus %s", util::format_cpulist(snap.parked).c_str());

  ExecutorResponse last;
  auto still = unpark_cores(cores, last);
  return finish_unpark(lk, still, last, ParkOutcome::Done);
}

} // namespace lasso::app
