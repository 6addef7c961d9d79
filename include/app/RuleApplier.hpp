#pragma once
#include "app/PidLocks.hpp"
#include "app/ProcessControl.hpp"
#include "model/Rules.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lasso::app {

// Issues the writes an assignment list asks for and remembers what each
// process had before its first change, so reset can put it back. Priority
// for a pid the holder owns is handed to the holder instead of written.
class RuleApplier {
public:
  RuleApplier(IProcessControl& control, PidLockTable& locks, IPriorityHolder* holder = nullptr)
    : control_(control), locks_(locks), holder_(holder) {}

  // Returns the number of processes that received at least one write.
  size_t apply(const std::vector<model::AffinityAssignment>& assignments);

  // Restore every touched process to its captured original. Returns count restored.
  size_t restore_all();

  // Drop bookkeeping for processes that have exited.
  void prune(const std::unordered_set<int32_t>& alive);

  [[nodiscard]] size_t touched_count() const;

private:
  struct Original {
    std::optional<model::CoreSet> affinity;
    std::optional<int> nice;
    std::optional<model::IoPriority> io;
    bool affinity_changed{false};
    bool priority_changed{false};
  };

  bool apply_one(const model::AffinityAssignment& a, Original& orig);

  IProcessControl& control_;
  PidLockTable& locks_;
  IPriorityHolder* holder_;
  mutable std::mutex mu_;
  std::unordered_map<int32_t, Original> originals_;
};

} // namespace lasso::app
