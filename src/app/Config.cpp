#include "app/Config.hpp"
#include "util/CpuList.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>

namespace lasso::app {

using model::AffinityRule;

const char* getenv_nonempty(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_nonempty(name);
  if (!v) return defv;
  int out = 0;
  auto end = v + std::char_traits<char>::length(v);
  auto [ptr, ec] = std::from_chars(v, end, out);
  if (ec != std::errc{} || ptr != end) return defv;
  return out;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/lasso/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/lasso/config.toml";
  return "lasso.toml";
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml, const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml, const char* section,
                                  const char* key, const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    if (const char* v = getenv_nonempty(env_name)) return std::string(v);
  }
  return def;
}

static std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t comma = s.find(',', start);
    if (comma == std::string::npos) comma = s.size();
    std::string item = s.substr(start, comma - start);
    while (!item.empty() && item.front() == ' ') item.erase(item.begin());
    while (!item.empty() && item.back() == ' ') item.pop_back();
    if (!item.empty()) out.push_back(item);
    start = comma + 1;
  }
  return out;
}

static std::string join_list(const std::vector<std::string>& v) {
  std::string out;
  for (const auto& s : v) {
    if (!out.empty()) out += ',';
    out += s;
  }
  return out;
}

// [rule.N] sections ordered by N
static std::vector<std::pair<int, std::string>> rule_sections(const util::TomlReader& toml) {
  std::vector<std::pair<int, std::string>> out;
  for (const auto& name : toml.section_names()) {
    if (name.rfind("rule.", 0) != 0) continue;
    int n = 0;
    auto b = name.data() + 5, e = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(b, e, n);
    if (ec != std::errc{} || ptr != e || b == e) {
      LASSO_LOG_WARN("Config", "ignoring section [%s]: expected [rule.<index>]", name.c_str());
      continue;
    }
    out.emplace_back(n, name);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
  return out;
}

static std::optional<AffinityRule> load_rule(const util::TomlReader& toml, const std::string& sec) {
  AffinityRule r;
  r.pattern = toml.get_string(sec, "pattern");
  if (r.pattern.empty()) {
    LASSO_LOG_WARN("Config", "[%s] has no pattern; skipped", sec.c_str());
    return std::nullopt;
  }
  r.id = toml.get_string(sec, "id");
  if (r.id.empty()) r.id = RuleStore::generate_id();
  r.name = toml.get_string(sec, "name");
  if (auto m = model::parse_match_mode(toml.get_string(sec, "match", "contains"))) r.match_mode = *m;
  else LASSO_LOG_WARN("Config", "[%s] unknown match mode; using contains", sec.c_str());
  if (auto s = model::parse_core_scope(toml.get_string(sec, "scope", "explicit"))) r.scope = *s;
  else LASSO_LOG_WARN("Config", "[%s] unknown scope; using explicit", sec.c_str());
  if (auto cores = util::parse_cpulist(toml.get_string(sec, "cores"))) r.target_cores = *cores;
  else LASSO_LOG_WARN("Config", "[%s] cores is not a cpulist; ignoring it", sec.c_str());
  if (toml.has(sec, "nice")) {
    int n = toml.get_int(sec, "nice", 0);
    if (n >= model::kNiceMin && n <= model::kNiceMax) r.nice = n;
    else LASSO_LOG_WARN("Config", "[%s] nice %d out of range; ignoring it", sec.c_str(), n);
  }
  if (toml.has(sec, "ioclass")) {
    if (auto io = model::parse_io_priority(toml.get_string(sec, "ioclass"))) r.io = *io;
    else LASSO_LOG_WARN("Config", "[%s] bad ioclass; ignoring it", sec.c_str());
  }
  r.enabled = toml.get_bool(sec, "enabled", true);
  if (r.match_mode == model::MatchMode::Regex && !RuleMatcher(r).valid())
    LASSO_LOG_WARN("Config", "rule '%s': regex /%s/ does not compile; it will match nothing", r.id.c_str(),
                   r.pattern.c_str());
  return r;
}

LassoConfig load_config(const std::string& path) {
  LassoConfig c;
  util::TomlReader toml;
  bool have_toml = toml.load(path);

  auto& pb = c.probalance;
  pb.enabled = toml.get_bool("probalance", "enabled", pb.enabled);
  pb.interval = std::chrono::milliseconds(std::max(100, resolve_int(toml, have_toml, "probalance", "interval_ms", nullptr,
                                                                     static_cast<int>(pb.interval.count()))));
  pb.throttle_threshold_pct = toml.get_double("probalance", "throttle_threshold_pct", pb.throttle_threshold_pct);
  pb.load_threshold_pct = toml.get_double("probalance", "load_threshold_pct", pb.load_threshold_pct);
  pb.sustain_ticks = std::max(1, toml.get_int("probalance", "throttle_sustain_ticks", pb.sustain_ticks));
  pb.restore_threshold_pct = toml.get_double("probalance", "restore_threshold_pct", pb.restore_threshold_pct);
  pb.restore_hold_ticks = std::max(1, toml.get_int("probalance", "restore_hold_ticks", pb.restore_hold_ticks));
  pb.nice_step = std::clamp(toml.get_int("probalance", "nice_step", pb.nice_step), 1, 39);
  pb.nice_ceiling = std::clamp(toml.get_int("probalance", "nice_ceiling", pb.nice_ceiling), model::kNiceMin, model::kNiceMax);
  pb.throttle_io = toml.get_bool("probalance", "throttle_io", pb.throttle_io);
  if (toml.has("probalance", "exempt")) pb.exempt = split_list(toml.get_string("probalance", "exempt"));
  if (pb.restore_threshold_pct > pb.throttle_threshold_pct) {
    LASSO_LOG_WARN("Config", "restore_threshold_pct above throttle_threshold_pct; clamping");
    pb.restore_threshold_pct = pb.throttle_threshold_pct;
  }

  auto da = toml.get_string("cpu", "default_affinity");
  if (auto parsed = parse_default_affinity(da)) c.default_affinity = *parsed;
  else LASSO_LOG_WARN("Config", "default_affinity '%s' not understood; disabled", da.c_str());

  c.gaming_last_intent = toml.get_bool("gaming", "last_intent", false);
  c.gaming_elevate_nice = toml.get_bool("gaming", "elevate_nice", false);

  c.executor.helper_path = resolve_string(toml, have_toml, "executor", "helper_path", "LASSO_HELPER_PATH",
                                          c.executor.helper_path);
  c.executor.timeout = std::chrono::milliseconds(std::max(100, resolve_int(toml, have_toml, "executor", "timeout_ms",
      "LASSO_EXECUTOR_TIMEOUT_MS", static_cast<int>(c.executor.timeout.count()))));

  c.scan_interval = std::chrono::milliseconds(std::max(100, toml.get_int("monitor", "scan_interval_ms",
                                                                         static_cast<int>(c.scan_interval.count()))));

  // The environment overrides the file for log level
  c.log_level = toml.get_string("log", "level", c.log_level);
  if (const char* env = getenv_nonempty("LASSO_LOG_LEVEL")) c.log_level = env;

  for (const auto& [n, sec] : rule_sections(toml)) {
    if (auto r = load_rule(toml, sec)) c.rules.push_back(std::move(*r));
  }
  return c;
}

bool save_config(const LassoConfig& c, const std::string& path) {
  util::TomlReader toml;
  const auto& pb = c.probalance;
  toml.set("probalance", "enabled", pb.enabled);
  toml.set("probalance", "interval_ms", static_cast<int>(pb.interval.count()));
  toml.set("probalance", "throttle_threshold_pct", pb.throttle_threshold_pct);
  toml.set("probalance", "load_threshold_pct", pb.load_threshold_pct);
  toml.set("probalance", "throttle_sustain_ticks", pb.sustain_ticks);
  toml.set("probalance", "restore_threshold_pct", pb.restore_threshold_pct);
  toml.set("probalance", "restore_hold_ticks", pb.restore_hold_ticks);
  toml.set("probalance", "nice_step", pb.nice_step);
  toml.set("probalance", "nice_ceiling", pb.nice_ceiling);
  toml.set("probalance", "throttle_io", pb.throttle_io);
  toml.set("probalance", "exempt", join_list(pb.exempt));

  toml.set("cpu", "default_affinity", to_string(c.default_affinity));

  toml.set("gaming", "last_intent", c.gaming_last_intent);
  toml.set("gaming", "elevate_nice", c.gaming_elevate_nice);

  toml.set("executor", "helper_path", c.executor.helper_path);
  toml.set("executor", "timeout_ms", static_cast<int>(c.executor.timeout.count()));

  toml.set("monitor", "scan_interval_ms", static_cast<int>(c.scan_interval.count()));
  toml.set("log", "level", c.log_level);

  for (size_t i = 0; i < c.rules.size(); ++i) {
    const auto& r = c.rules[i];
    const std::string sec = "rule." + std::to_string(i);
    toml.set(sec, "id", r.id);
    toml.set(sec, "name", r.name);
    toml.set(sec, "pattern", r.pattern);
    toml.set(sec, "match", model::to_string(r.match_mode));
    toml.set(sec, "cores", util::format_cpulist(r.target_cores));
    toml.set(sec, "scope", model::to_string(r.scope));
    if (r.nice) toml.set(sec, "nice", *r.nice);
    if (r.io) toml.set(sec, "ioclass", model::to_string(*r.io));
    toml.set(sec, "enabled", r.enabled);
  }

  if (!toml.save(path)) {
    LASSO_LOG_ERROR("Config", "could not write %s", path.c_str());
    return false;
  }
  return true;
}

} // namespace lasso::app
