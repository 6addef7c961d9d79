#pragma once
#include "app/PidLocks.hpp"
#include "app/ProcessControl.hpp"
#include "model/Priority.hpp"
#include "model/Process.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lasso::app {

struct GovernorConfig {
  bool enabled{true};
  std::chrono::milliseconds interval{1000};
  double throttle_threshold_pct{85.0};  // per-process, 100 = one full core
  double load_threshold_pct{50.0};      // whole machine busy %
  int sustain_ticks{3};
  double restore_threshold_pct{40.0};
  int restore_hold_ticks{5};
  int nice_step{10};
  int nice_ceiling{15};
  bool throttle_io{true};
  std::vector<std::string> exempt{"kwin", "plasmashell", "systemd", "kthreadd", "Xorg", "xwayland", "gnome-shell", "mutter"};
};

struct GovernorTick {
  size_t throttled{0};
  size_t restored{0};
  size_t pruned{0};
};

// Deprioritizes sustained CPU hogs while the machine is busy and restores them
// once they have stayed quiet for restore_hold_ticks consecutive ticks. A
// throttled process's priority belongs to the governor until it is restored;
// rule writes for it are deferred to the restore.
class ProBalanceGovernor : public IPriorityHolder {
public:
  ProBalanceGovernor(IProcessControl& control, PidLockTable& locks, GovernorConfig cfg = {});

  GovernorTick tick(const model::ProcessSnapshot& snap, double system_load_pct);

  // Currently throttled processes. Never waits on a running tick.
  [[nodiscard]] std::vector<model::ProcessPriorityState> status() const;

  void set_config(GovernorConfig cfg);
  [[nodiscard]] GovernorConfig config() const;

  // Put every throttled process back. Returns number restored.
  size_t restore_all();

  [[nodiscard]] bool is_exempt(const model::ProcessView& p) const;

  std::optional<PriorityTarget> defer_priority(int32_t pid, std::optional<int> nice,
                                               std::optional<model::IoPriority> io) override;

private:
  bool restore_one(const model::ProcessPriorityState& st, model::ErrorKind& err, int& nice_out);
  void release(int32_t pid);
  size_t restore_locked();
  void publish();

  IProcessControl& control_;
  PidLockTable& locks_;
  int32_t own_pid_;

  mutable std::mutex cfg_mu_;
  GovernorConfig cfg_;

  std::mutex tick_mu_;  // one tick or restore at a time
  struct HighCount { uint64_t start_time; int ticks; };
  std::unordered_map<int32_t, HighCount> high_;
  std::unordered_map<int32_t, model::ProcessPriorityState> throttled_;

  // What each throttled pid goes back to. Set and consumed under the pid's stripe lock.
  mutable std::mutex held_mu_;
  std::unordered_map<int32_t, PriorityTarget> held_;

  mutable std::mutex pub_mu_;
  std::vector<model::ProcessPriorityState> published_;
};

} // namespace lasso::app
