#pragma once
#include "model/Errors.hpp"
#include "model/Process.hpp"
#include "model/Rules.hpp"
#include "model/Topology.hpp"

#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace lasso::app {

// Compiled form of one rule's pattern.
class RuleMatcher {
public:
  explicit RuleMatcher(const model::AffinityRule& rule);
  [[nodiscard]] bool matches(const std::string& name) const;
  // False when a regex pattern failed to compile; such a rule never matches
  [[nodiscard]] bool valid() const { return valid_; }
private:
  model::MatchMode mode_;
  std::string pattern_;
  std::string pattern_lower_;
  bool wildcard_{false};
  bool valid_{true};
  std::optional<std::regex> compiled_;
};

// Affinity for processes no rule matches. Empty spec disables it.
struct DefaultAffinity {
  model::CoreScope scope{model::CoreScope::Explicit};
  model::CoreSet cores;
};
// "", "preferred", "nonpreferred" or a cpulist
[[nodiscard]] std::optional<std::optional<DefaultAffinity>> parse_default_affinity(const std::string& s);
[[nodiscard]] std::string to_string(const std::optional<DefaultAffinity>& d);

struct ApplyContext {
  model::Topology topology{};  // uniform = scoped rules resolve to nothing
  model::CoreSet online;  // empty = do not intersect
  std::optional<DefaultAffinity> default_affinity;
  // While Gaming Mode holds cores parked, rule matches without their own
  // nice get this one
  std::optional<int> gaming_nice;
};

// Cores a scope/target pair means right now. Explicit targets are clipped
// to the online set; an empty result means "leave affinity alone".
[[nodiscard]] model::CoreSet resolve_cores(model::CoreScope scope, const model::CoreSet& explicit_cores,
                                           const ApplyContext& ctx);

// First enabled matching rule wins. Processes without a match get the default
// affinity when one is configured, otherwise no assignment.
[[nodiscard]] std::vector<model::AffinityAssignment> apply_rules(const std::vector<model::AffinityRule>& rules,
                                                                const std::vector<model::ProcessView>& processes,
                                                                const ApplyContext& ctx = {});

// Shape check for a rule before it is stored.
[[nodiscard]] model::ErrorKind validate_rule(const model::AffinityRule& rule, std::string& err);

// Ordered, thread-safe rule list.
class RuleStore {
public:
  RuleStore() = default;
  explicit RuleStore(std::vector<model::AffinityRule> rules);

  [[nodiscard]] std::vector<model::AffinityRule> list() const;
  void replace_all(std::vector<model::AffinityRule> rules);

  // Assigns an id when the rule has none. Returns the stored rule's id.
  model::ErrorKind add(model::AffinityRule rule, std::string& id_out, std::string& err);
  model::ErrorKind remove(const std::string& id);
  model::ErrorKind update(const model::AffinityRule& rule, std::string& err);

  [[nodiscard]] static std::string generate_id();

private:
  mutable std::mutex mu_;
  std::vector<model::AffinityRule> rules_;
};

} // namespace lasso::app
