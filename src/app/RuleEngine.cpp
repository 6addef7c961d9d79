#include "app/RuleEngine.hpp"
#include "util/CpuList.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <random>

namespace lasso::app {

using model::AffinityAssignment;
using model::AffinityRule;
using model::CoreScope;
using model::CoreSet;
using model::ErrorKind;
using model::MatchMode;

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

RuleMatcher::RuleMatcher(const AffinityRule& rule)
  : mode_(rule.match_mode), pattern_(rule.pattern), pattern_lower_(lower(rule.pattern)) {
  wildcard_ = pattern_ == "*";
  if (mode_ == MatchMode::Regex && !wildcard_ && !pattern_.empty()) {
    try {
      compiled_.emplace(pattern_);
    } catch (const std::regex_error&) {
      // Reported once when the rule is loaded
      valid_ = false;
    }
  }
}

bool RuleMatcher::matches(const std::string& name) const {
  if (!valid_ || pattern_.empty()) return false;
  if (wildcard_) return true;
  switch (mode_) {
    case MatchMode::Exact: return name == pattern_;
    case MatchMode::Contains: return lower(name).find(pattern_lower_) != std::string::npos;
    case MatchMode::Regex: return compiled_ && std::regex_search(name, *compiled_);
  }
  return false;
}

std::optional<std::optional<DefaultAffinity>> parse_default_affinity(const std::string& s) {
  if (s.empty()) return std::optional<DefaultAffinity>{};
  if (auto scope = model::parse_core_scope(s); scope && *scope != CoreScope::Explicit)
    return std::optional<DefaultAffinity>{DefaultAffinity{*scope, {}}};
  auto cores = util::parse_cpulist(s);
  if (!cores || cores->empty()) return std::nullopt;
  return std::optional<DefaultAffinity>{DefaultAffinity{CoreScope::Explicit, *cores}};
}

std::string to_string(const std::optional<DefaultAffinity>& d) {
  if (!d) return {};
  if (d->scope != CoreScope::Explicit) return model::to_string(d->scope);
  return util::format_cpulist(d->cores);
}

CoreSet resolve_cores(CoreScope scope, const CoreSet& explicit_cores, const ApplyContext& ctx) {
  CoreSet base;
  switch (scope) {
    case CoreScope::Explicit: base = explicit_cores; break;
    case CoreScope::Preferred:
      if (ctx.topology.has_asymmetry) base = ctx.topology.preferred;
      break;
    case CoreScope::NonPreferred:
      if (ctx.topology.has_asymmetry) base = ctx.topology.non_preferred;
      break;
  }
  if (ctx.online.empty()) return base;
  CoreSet out;
  std::set_intersection(base.begin(), base.end(), ctx.online.begin(), ctx.online.end(), std::inserter(out, out.end()));
  return out;
}

std::vector<AffinityAssignment> apply_rules(const std::vector<AffinityRule>& rules,
                                            const std::vector<model::ProcessView>& processes,
                                            const ApplyContext& ctx) {
  std::vector<std::pair<const AffinityRule*, RuleMatcher>> active;
  active.reserve(rules.size());
  for (const auto& r : rules)
    if (r.enabled) active.emplace_back(&r, RuleMatcher(r));

  CoreSet default_cores;
  if (ctx.default_affinity) default_cores = resolve_cores(ctx.default_affinity->scope, ctx.default_affinity->cores, ctx);

  std::vector<AffinityAssignment> out;
  for (const auto& p : processes) {
    const AffinityRule* hit = nullptr;
    for (const auto& [rule, matcher] : active) {
      if (matcher.matches(p.name)) { hit = rule; break; }
    }
    AffinityAssignment a;
    a.pid = p.pid;
    a.process_name = p.name;
    if (hit) {
      a.source = model::AssignmentSource::Rule;
      a.rule_id = hit->id;
      a.cores = resolve_cores(hit->scope, hit->target_cores, ctx);
      a.nice = hit->nice ? hit->nice : ctx.gaming_nice;
      a.io = hit->io;
    } else if (!default_cores.empty()) {
      a.source = model::AssignmentSource::DefaultAffinity;
      a.cores = default_cores;
    } else {
      continue;
    }
    out.push_back(std::move(a));
  }
  return out;
}

ErrorKind validate_rule(const AffinityRule& rule, std::string& err) {
  if (rule.pattern.empty()) { err = "pattern is empty"; return ErrorKind::InvalidRequest; }
  for (const std::string* s : {&rule.pattern, &rule.name, &rule.id}) {
    for (char c : *s) {
      if (static_cast<unsigned char>(c) < 0x20) { err = "control character in rule field"; return ErrorKind::InvalidRequest; }
    }
  }
  if (rule.match_mode == MatchMode::Regex && rule.pattern != "*") {
    try {
      std::regex re(rule.pattern);
    } catch (const std::regex_error& e) {
      err = std::string("regex does not compile: ") + e.what();
      return ErrorKind::InvalidRequest;
    }
  }
  if (rule.nice && (*rule.nice < model::kNiceMin || *rule.nice > model::kNiceMax)) {
    err = "nice out of range";
    return ErrorKind::InvalidRequest;
  }
  for (int c : rule.target_cores) {
    if (c < 0 || c > 8191) { err = "core id out of range"; return ErrorKind::InvalidRequest; }
  }
  if (rule.scope == CoreScope::Explicit && rule.target_cores.empty() && !rule.nice && !rule.io) {
    err = "rule sets neither cores nor priority";
    return ErrorKind::InvalidRequest;
  }
  return ErrorKind::None;
}

RuleStore::RuleStore(std::vector<AffinityRule> rules) : rules_(std::move(rules)) {}

std::vector<AffinityRule> RuleStore::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  return rules_;
}

void RuleStore::replace_all(std::vector<AffinityRule> rules) {
  std::lock_guard<std::mutex> lk(mu_);
  rules_ = std::move(rules);
}

std::string RuleStore::generate_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
  return buf;
}

ErrorKind RuleStore::add(AffinityRule rule, std::string& id_out, std::string& err) {
  if (auto e = validate_rule(rule, err); e != ErrorKind::None) return e;
  std::lock_guard<std::mutex> lk(mu_);
  if (rule.id.empty()) rule.id = generate_id();
  for (const auto& r : rules_) {
    if (r.id == rule.id) { err = "duplicate rule id " + rule.id; return ErrorKind::InvalidRequest; }
  }
  id_out = rule.id;
  rules_.push_back(std::move(rule));
  return ErrorKind::None;
}

ErrorKind RuleStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = std::find_if(rules_.begin(), rules_.end(), [&](const AffinityRule& r) { return r.id == id; });
  if (it == rules_.end()) return ErrorKind::TargetNotFound;
  rules_.erase(it);
  return ErrorKind::None;
}

ErrorKind RuleStore::update(const AffinityRule& rule, std::string& err) {
  if (auto e = validate_rule(rule, err); e != ErrorKind::None) return e;
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& r : rules_) {
    if (r.id == rule.id) { r = rule; return ErrorKind::None; }
  }
  err = "no rule with id " + rule.id;
  return ErrorKind::TargetNotFound;
}

} // namespace lasso::app
