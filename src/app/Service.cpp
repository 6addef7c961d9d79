#include "app/Service.hpp"
#include "app/Classifier.hpp"
#include "util/CpuList.hpp"
#include "util/Log.hpp"

#include <algorithm>

namespace lasso::app {

using model::ErrorKind;
using model::ParkOutcome;
using model::ParkPhase;
using model::ParkResult;

Service::Service(LassoConfig cfg, std::string config_path, IExecutor& executor, collectors::ICoreProbe& probe,
                 IProcessControl& control, collectors::IProcessCollector& procs, FactSource facts)
  : config_path_(std::move(config_path)),
    cfg_(std::move(cfg)),
    executor_(executor),
    probe_(probe),
    facts_(std::move(facts)),
    parking_(executor, probe),
    rules_(cfg_.rules),
    governor_(control, locks_, cfg_.probalance),
    applier_(control, locks_, &governor_),
    monitor_(procs, rules_, applier_, governor_, [this] { return apply_context(); }) {}

Service::~Service() {
  stop();
  std::lock_guard<std::mutex> lk(worker_mu_);
  if (worker_.joinable()) worker_.join();
}

LassoConfig Service::config() const {
  std::lock_guard<std::mutex> lk(cfg_mu_);
  return cfg_;
}

bool Service::persist() {
  LassoConfig snapshot;
  {
    std::lock_guard<std::mutex> lk(cfg_mu_);
    cfg_.rules = rules_.list();
    snapshot = cfg_;
  }
  if (config_path_.empty()) return true;
  return save_config(snapshot, config_path_);
}

ApplyContext Service::apply_context() {
  ApplyContext ctx;
  {
    std::lock_guard<std::mutex> lk(topo_mu_);
    if (topology_) ctx.topology = *topology_;
  }
  ctx.online = probe_.online_cores();
  bool elevate;
  {
    std::lock_guard<std::mutex> lk(cfg_mu_);
    ctx.default_affinity = cfg_.default_affinity;
    elevate = cfg_.gaming_elevate_nice;
  }
  if (elevate && parking_.current_state().phase == ParkPhase::Parked) ctx.gaming_nice = -1;
  return ctx;
}

model::Topology Service::classify() {
  {
    std::lock_guard<std::mutex> lk(topo_mu_);
    if (topology_) return *topology_;
  }
  return rescan();
}

model::Topology Service::rescan() {
  // Offline cores hide their cache info, so a scan now would see a false picture
  if (parking_.current_state().phase != ParkPhase::Unparked) {
    std::lock_guard<std::mutex> lk(topo_mu_);
    if (topology_) {
      LASSO_LOG_INFO("Service", "cores are parked; disable Gaming Mode before re-scanning topology");
      return *topology_;
    }
  }
  auto facts = facts_ ? facts_() : std::vector<model::CoreFact>{};
  auto topo = app::classify(facts);
  if (!topo.has_asymmetry) {
    // An unclean exit can leave the non-preferred CCD offline, which hides its
    // cache info. If we were the ones who parked it, the offline set is it.
    bool intent;
    {
      std::lock_guard<std::mutex> lk(cfg_mu_);
      intent = cfg_.gaming_last_intent;
    }
    auto offline = probe_.offline_cores();
    auto online = probe_.online_cores();
    if (intent && !offline.empty() && !online.empty()) {
      topo.preferred = online;
      topo.non_preferred = offline;
      topo.has_asymmetry = true;
      topo.reason = model::ClassificationReason::CacheAsymmetricCCD;
      topo.description = "Preferred: CPUs " + util::format_cpulist(online) + ". Non-preferred (left parked): CPUs " +
                         util::format_cpulist(offline) + ".";
    }
  }
  LASSO_LOG_INFO("Service", "topology: %s", topo.description.c_str());
  std::lock_guard<std::mutex> lk(topo_mu_);
  topology_ = topo;
  return topo;
}

void Service::after_transition(bool on, const ParkResult& r) {
  if (r.outcome == ParkOutcome::Done || r.outcome == ParkOutcome::AlreadyInState || r.outcome == ParkOutcome::Cancelled) {
    bool intent = on && r.outcome != ParkOutcome::Cancelled;
    bool changed;
    bool elevate;
    {
      std::lock_guard<std::mutex> lk(cfg_mu_);
      changed = cfg_.gaming_last_intent != intent;
      cfg_.gaming_last_intent = intent;
      elevate = cfg_.gaming_elevate_nice;
    }
    if (changed) (void)persist();
    // Preferred/non-preferred targets and elevation depend on the parked set
    if (!on && elevate) applier_.restore_all();
    monitor_.request_reapply();
  }
}

ParkResult Service::set_gaming_mode_sync(bool on) {
  ParkResult r = on ? parking_.enable(classify()) : parking_.disable();
  LASSO_LOG_INFO("Service", "gaming mode %s: %s (%s)", on ? "on" : "off", model::to_string(r.outcome),
                 model::to_string(r.state.phase));
  after_transition(on, r);
  return r;
}

ParkResult Service::request_gaming_mode(bool on) {
  auto state = parking_.current_state();
  // disable() during Parking flags the cancel and waits out at most one write
  if (!on && state.phase == ParkPhase::Parking) {
    auto r = parking_.disable();
    after_transition(false, r);
    return r;
  }
  std::lock_guard<std::mutex> lk(worker_mu_);
  if (worker_busy_.load())
    return {ParkOutcome::InProgress, parking_.current_state()};
  if (worker_.joinable()) worker_.join();
  worker_busy_.store(true);
  worker_ = std::jthread([this, on](std::stop_token) {
    (void)set_gaming_mode_sync(on);
    worker_busy_.store(false);
  });
  return {ParkOutcome::InProgress, parking_.current_state()};
}

model::ParkState Service::current_state() const { return parking_.current_state(); }

bool Service::wait_settled(std::chrono::milliseconds timeout) const {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (worker_busy_.load()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  return parking_.wait_settled(std::max(left, std::chrono::milliseconds(0)));
}

std::vector<model::AffinityRule> Service::list_rules() const { return rules_.list(); }

ErrorKind Service::add_rule(model::AffinityRule rule, std::string& id_out, std::string& err) {
  auto e = rules_.add(std::move(rule), id_out, err);
  if (e != ErrorKind::None) {
    LASSO_LOG_WARN("Service", "add rule refused: %s", err.c_str());
    return e;
  }
  if (!persist()) { err = "rule added but config could not be saved"; return ErrorKind::WriteFailed; }
  monitor_.request_reapply();
  return ErrorKind::None;
}

ErrorKind Service::remove_rule(const std::string& id) {
  auto e = rules_.remove(id);
  if (e != ErrorKind::None) return e;
  if (!persist()) return ErrorKind::WriteFailed;
  monitor_.request_reapply();
  return ErrorKind::None;
}

ErrorKind Service::update_rule(const model::AffinityRule& rule, std::string& err) {
  auto e = rules_.update(rule, err);
  if (e != ErrorKind::None) return e;
  if (!persist()) { err = "rule updated but config could not be saved"; return ErrorKind::WriteFailed; }
  monitor_.request_reapply();
  return ErrorKind::None;
}

ErrorKind Service::set_default_affinity(const std::string& spec) {
  auto parsed = parse_default_affinity(spec);
  if (!parsed) return ErrorKind::InvalidRequest;
  {
    std::lock_guard<std::mutex> lk(cfg_mu_);
    cfg_.default_affinity = *parsed;
  }
  if (!persist()) return ErrorKind::WriteFailed;
  monitor_.request_reapply();
  return ErrorKind::None;
}

std::vector<model::ProcessPriorityState> Service::governor_status() const { return governor_.status(); }

ServiceStatus Service::status() {
  ServiceStatus s;
  s.topology = classify();
  s.park = parking_.current_state();
  s.rules = rules_.list().size();
  s.throttled = governor_.status().size();
  auto cfg = config();
  s.helper_installed = helper_installed(cfg.executor.helper_path);
  s.gaming_intent = cfg.gaming_last_intent;
  return s;
}

ResetReport Service::reset_all() {
  ResetReport rep;
  rep.processes_restored = applier_.restore_all();
  rep.throttles_restored = governor_.restore_all();

  auto pr = parking_.disable();
  if (pr.outcome == ParkOutcome::Failed) { rep.error = pr.state.error; rep.detail = pr.state.reason; }
  after_transition(false, pr);

  // Anything else left offline, by us in an earlier run or by someone else
  for (model::CoreId c : probe_.offline_cores()) {
    if (!probe_.is_hotpluggable(c)) continue;
    auto resp = executor_.execute(ExecutorRequest::unpark(c));
    if (resp.ok()) {
      rep.cores_onlined.insert(c);
    } else {
      report_failure("Service", resp, "online cpu" + std::to_string(c));
      if (rep.error == ErrorKind::None) { rep.error = resp.error; rep.detail = resp.detail; }
    }
  }
  LASSO_LOG_INFO("Service", "reset: %zu processes, %zu throttles, cpus %s brought online", rep.processes_restored,
                 rep.throttles_restored, util::format_cpulist(rep.cores_onlined).c_str());
  return rep;
}

size_t Service::restore_throttles() {
  size_t n = governor_.restore_all();
  if (n > 0) LASSO_LOG_INFO("Service", "restored %zu throttled processes", n);
  return n;
}

void Service::start() {
  auto cfg = config();
  monitor_.start(cfg.scan_interval);
}

void Service::stop() { monitor_.stop(); }

} // namespace lasso::app
