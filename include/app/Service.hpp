#pragma once
#include "app/Config.hpp"
#include "app/Executor.hpp"
#include "app/Monitor.hpp"
#include "app/ParkingController.hpp"
#include "app/PidLocks.hpp"
#include "app/ProBalance.hpp"
#include "app/ProcessControl.hpp"
#include "app/RuleApplier.hpp"
#include "app/RuleEngine.hpp"
#include "collectors/ICoreProbe.hpp"
#include "collectors/IProcessCollector.hpp"
#include "model/Park.hpp"
#include "model/Topology.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lasso::app {

struct ResetReport {
  size_t processes_restored{0};
  size_t throttles_restored{0};
  model::CoreSet cores_onlined;
  model::ErrorKind error{model::ErrorKind::None};
  std::string detail;
};

struct ServiceStatus {
  model::Topology topology;
  model::ParkState park;
  size_t rules{0};
  size_t throttled{0};
  bool helper_installed{false};
  bool gaming_intent{false};
};

// Collaborator surface for a front end. Every call is non-blocking or bounded;
// the *_sync variants run a parking transition on the calling thread.
class Service {
public:
  using FactSource = std::function<std::vector<model::CoreFact>()>;

  Service(LassoConfig cfg, std::string config_path, IExecutor& executor, collectors::ICoreProbe& probe,
          IProcessControl& control, collectors::IProcessCollector& procs, FactSource facts);
  ~Service();

  // Cached after the first call. Refused while any core is parked by us.
  model::Topology classify();
  model::Topology rescan();

  // Runs on a worker; returns InProgress with a snapshot unless already settled
  model::ParkResult request_gaming_mode(bool on);
  model::ParkResult set_gaming_mode_sync(bool on);
  [[nodiscard]] model::ParkState current_state() const;
  bool wait_settled(std::chrono::milliseconds timeout) const;

  [[nodiscard]] std::vector<model::AffinityRule> list_rules() const;
  model::ErrorKind add_rule(model::AffinityRule rule, std::string& id_out, std::string& err);
  model::ErrorKind remove_rule(const std::string& id);
  model::ErrorKind update_rule(const model::AffinityRule& rule, std::string& err);
  model::ErrorKind set_default_affinity(const std::string& spec);

  [[nodiscard]] std::vector<model::ProcessPriorityState> governor_status() const;
  [[nodiscard]] ServiceStatus status();

  ResetReport reset_all();
  // Hand back every governor throttle; rule-applied masks and priorities stay.
  size_t restore_throttles();

  void start();
  void stop();
  // Drive the monitor without its thread
  void step(std::chrono::steady_clock::time_point now) { monitor_.step(now); }

  void subscribe_park_state(ParkingController::Listener l) { parking_.subscribe(std::move(l)); }

  [[nodiscard]] LassoConfig config() const;

private:
  ApplyContext apply_context();
  bool persist();
  void after_transition(bool on, const model::ParkResult& r);

  std::string config_path_;
  mutable std::mutex cfg_mu_;
  LassoConfig cfg_;

  IExecutor& executor_;
  collectors::ICoreProbe& probe_;
  FactSource facts_;

  PidLockTable locks_{};
  ParkingController parking_;
  RuleStore rules_;
  ProBalanceGovernor governor_;
  RuleApplier applier_;
  Monitor monitor_;

  mutable std::mutex topo_mu_;
  std::optional<model::Topology> topology_;

  std::mutex worker_mu_;
  std::jthread worker_{};
  std::atomic<bool> worker_busy_{false};
};

} // namespace lasso::app
