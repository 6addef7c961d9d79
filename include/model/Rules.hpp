#pragma once
#include "model/Priority.hpp"
#include "model/Topology.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace lasso::model {

enum class MatchMode { Exact, Contains, Regex };

// What a rule's cores are relative to. Preferred/NonPreferred resolve against
// the live Topology at apply time; Explicit uses target_cores as written.
enum class CoreScope { Explicit, Preferred, NonPreferred };

struct AffinityRule {
  std::string id;
  std::string name;
  std::string pattern;
  MatchMode match_mode{MatchMode::Contains};
  CoreSet target_cores;
  CoreScope scope{CoreScope::Explicit};
  std::optional<int> nice;
  std::optional<IoPriority> io;
  bool enabled{true};

  bool operator==(const AffinityRule&) const = default;
};

enum class AssignmentSource { Rule, DefaultAffinity };

// Outcome of matching one process: which cores (and optional priority) it gets.
struct AffinityAssignment {
  int32_t pid{};
  std::string process_name;
  AssignmentSource source{AssignmentSource::Rule};
  std::string rule_id;  // empty for DefaultAffinity
  CoreSet cores;        // empty = leave affinity alone
  std::optional<int> nice;
  std::optional<IoPriority> io;
};

[[nodiscard]] const char* to_string(MatchMode m);
[[nodiscard]] std::optional<MatchMode> parse_match_mode(const std::string& s);
[[nodiscard]] const char* to_string(CoreScope s);
[[nodiscard]] std::optional<CoreScope> parse_core_scope(const std::string& s);

} // namespace lasso::model
