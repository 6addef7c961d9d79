#include "app/Config.hpp"
#include "app/Executor.hpp"
#include "app/ProcessControl.hpp"
#include "app/Service.hpp"
#include "collectors/CpuTopologyCollector.hpp"
#include "collectors/ProcessCollector.hpp"
#include "model/Errors.hpp"
#include "util/CpuList.hpp"
#include "util/Log.hpp"

#include <unistd.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

enum class Command { None, Classify, Status, GamingMode, ListRules, AddRule, RemoveRule, DefaultAffinity, Reset, Run };

static void print_usage() {
  std::cout << "Usage: lasso [--config PATH] COMMAND\n"
               "Commands:\n"
               "  --classify                       detect preferred / non-preferred cores\n"
               "  --status                         topology, Gaming Mode, rules, throttled processes\n"
               "  --gaming-mode on|off             park or unpark the non-preferred cores\n"
               "  --list-rules\n"
               "  --add-rule PATTERN MATCH TARGET  MATCH: exact|contains|regex\n"
               "                                   TARGET: cpulist, preferred, nonpreferred or -\n"
               "      [--name NAME] [--nice N] [--ioclass none|rt:L|be:L|idle] [--disabled]\n"
               "  --remove-rule ID\n"
               "  --default-affinity SPEC          cpulist, preferred, nonpreferred or \"\" to clear\n"
               "  --reset                          undo every affinity, priority and parking change\n"
               "  --run [--iterations N] [--restore-gaming-mode]\n"
               "                                   apply rules and run ProBalance until Ctrl+C\n";
}

static std::optional<int> parse_int(const std::string& s) {
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

static int exit_for(lasso::model::ErrorKind e) {
  return e == lasso::model::ErrorKind::None ? 0 : 1;
}

static void print_error(lasso::model::ErrorKind e, const std::string& detail) {
  std::cerr << "lasso: " << lasso::model::to_string(e);
  if (!detail.empty()) std::cerr << ": " << detail;
  std::cerr << "\n";
  const char* hint = lasso::model::remediation_hint(e);
  if (hint && *hint) std::cerr << "hint: " << hint << "\n";
}

static void print_topology(const lasso::model::Topology& t) {
  std::cout << "Topology: " << lasso::model::to_string(t.reason) << "\n";
  std::cout << "  " << t.description << "\n";
  if (t.has_asymmetry) {
    std::cout << "  preferred:     " << lasso::util::format_cpulist(t.preferred) << "\n";
    std::cout << "  non-preferred: " << lasso::util::format_cpulist(t.non_preferred) << "\n";
  }
}

static void print_park(const lasso::model::ParkState& s) {
  std::cout << "Gaming Mode: " << lasso::model::to_string(s.phase);
  if (!s.parked.empty()) std::cout << " (parked " << lasso::util::format_cpulist(s.parked) << ")";
  std::cout << "\n";
  if (s.phase == lasso::model::ParkPhase::Failed)
    std::cout << "  " << lasso::model::to_string(s.error) << ": " << s.reason << "\n";
}

static void print_rules(const std::vector<lasso::model::AffinityRule>& rules) {
  if (rules.empty()) { std::cout << "No rules.\n"; return; }
  for (size_t i = 0; i < rules.size(); ++i) {
    const auto& r = rules[i];
    std::cout << i << ". [" << r.id << "] " << (r.enabled ? "" : "(disabled) ");
    if (!r.name.empty()) std::cout << r.name << ": ";
    std::cout << lasso::model::to_string(r.match_mode) << " '" << r.pattern << "' -> ";
    if (r.scope == lasso::model::CoreScope::Explicit) std::cout << lasso::util::format_cpulist(r.target_cores);
    else std::cout << lasso::model::to_string(r.scope);
    if (r.nice) std::cout << " nice " << *r.nice;
    if (r.io) std::cout << " io " << lasso::model::to_string(*r.io);
    std::cout << "\n";
  }
}

int main(int argc, char** argv) {
  using namespace lasso;
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  Command cmd = Command::None;
  std::string config_path = app::config_file_path();
  std::string gaming_arg, remove_id, default_spec;
  std::vector<std::string> rule_args;
  std::optional<int> rule_nice;
  std::optional<model::IoPriority> rule_io;
  std::string rule_name;
  bool rule_enabled = true;
  int iterations = 0;
  bool restore_gaming = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](int n) {
      if (i + n >= argc) {
        std::cerr << "lasso: " << a << " needs " << n << " argument(s)\n";
        std::exit(2);
      }
    };
    if (a == "--config") { need(1); config_path = argv[++i]; }
    else if (a == "--classify") cmd = Command::Classify;
    else if (a == "--status") cmd = Command::Status;
    else if (a == "--gaming-mode") { need(1); cmd = Command::GamingMode; gaming_arg = argv[++i]; }
    else if (a == "--list-rules") cmd = Command::ListRules;
    else if (a == "--add-rule") {
      need(3); cmd = Command::AddRule;
      for (int k = 0; k < 3; ++k) rule_args.emplace_back(argv[++i]);
    }
    else if (a == "--remove-rule") { need(1); cmd = Command::RemoveRule; remove_id = argv[++i]; }
    else if (a == "--default-affinity") { need(1); cmd = Command::DefaultAffinity; default_spec = argv[++i]; }
    else if (a == "--name") { need(1); rule_name = argv[++i]; }
    else if (a == "--nice") {
      need(1);
      rule_nice = parse_int(argv[++i]);
      if (!rule_nice) { std::cerr << "lasso: --nice expects an integer\n"; return 2; }
    }
    else if (a == "--ioclass") {
      need(1);
      rule_io = model::parse_io_priority(argv[++i]);
      if (!rule_io) { std::cerr << "lasso: --ioclass expects none|rt:L|be:L|idle\n"; return 2; }
    }
    else if (a == "--disabled") rule_enabled = false;
    else if (a == "--reset") cmd = Command::Reset;
    else if (a == "--run") cmd = Command::Run;
    else if (a == "--iterations") {
      need(1);
      auto n = parse_int(argv[++i]);
      if (!n) { std::cerr << "lasso: --iterations expects an integer\n"; return 2; }
      iterations = *n;
    }
    else if (a == "--restore-gaming-mode") restore_gaming = true;
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else { std::cerr << "lasso: unknown argument " << a << "\n"; print_usage(); return 2; }
  }
  if (cmd == Command::None) { print_usage(); return 2; }

  auto cfg = app::load_config(config_path);
  if (auto lvl = util::parse_log_level(cfg.log_level)) util::set_log_level(*lvl);
  else LASSO_LOG_WARN("Main", "unknown log level '%s'", cfg.log_level.c_str());

  app::ExecutorOptions exec_opts = cfg.executor;
  exec_opts.use_sudo = ::geteuid() != 0;
  app::SudoExecutor executor(exec_opts);
  collectors::CpuTopologyCollector topo_collector;
  collectors::ProcessCollector proc_collector;
  app::SystemProcessControl control(&executor);
  const bool last_intent = cfg.gaming_last_intent;
  app::Service service(std::move(cfg), config_path, executor, topo_collector, control, proc_collector,
                       [&topo_collector] { return topo_collector.collect(); });

  switch (cmd) {
    case Command::Classify: {
      print_topology(service.classify());
      return 0;
    }
    case Command::Status: {
      auto s = service.status();
      print_topology(s.topology);
      print_park(s.park);
      std::cout << "Helper: " << (s.helper_installed ? "installed" : "not installed") << "\n";
      std::cout << "Rules: " << s.rules << "\n";
      return 0;
    }
    case Command::GamingMode: {
      bool on;
      if (gaming_arg == "on") on = true;
      else if (gaming_arg == "off") on = false;
      else { std::cerr << "lasso: --gaming-mode expects on|off\n"; return 2; }
      auto r = service.set_gaming_mode_sync(on);
      print_park(r.state);
      if (r.outcome == model::ParkOutcome::Unsupported) { print_error(model::ErrorKind::Unsupported, ""); return 1; }
      if (r.outcome == model::ParkOutcome::Failed) { print_error(r.state.error, r.state.reason); return 1; }
      return 0;
    }
    case Command::ListRules: {
      print_rules(service.list_rules());
      return 0;
    }
    case Command::AddRule: {
      model::AffinityRule r;
      r.pattern = rule_args[0];
      auto mode = model::parse_match_mode(rule_args[1]);
      if (!mode) { print_error(model::ErrorKind::InvalidRequest, "match must be exact|contains|regex"); return 2; }
      r.match_mode = *mode;
      const std::string& target = rule_args[2];
      if (auto scope = model::parse_core_scope(target); scope && *scope != model::CoreScope::Explicit) {
        r.scope = *scope;
      } else if (target != "-") {
        auto cores = util::parse_cpulist(target);
        if (!cores) { print_error(model::ErrorKind::InvalidRequest, "bad cpulist '" + target + "'"); return 2; }
        r.target_cores = *cores;
      }
      r.name = rule_name;
      r.nice = rule_nice;
      r.io = rule_io;
      r.enabled = rule_enabled;
      std::string id, err;
      auto e = service.add_rule(r, id, err);
      if (e != model::ErrorKind::None) { print_error(e, err); return exit_for(e); }
      std::cout << "Added rule " << id << "\n";
      return 0;
    }
    case Command::RemoveRule: {
      auto e = service.remove_rule(remove_id);
      if (e != model::ErrorKind::None) { print_error(e, "rule " + remove_id); return exit_for(e); }
      std::cout << "Removed rule " << remove_id << "\n";
      return 0;
    }
    case Command::DefaultAffinity: {
      auto e = service.set_default_affinity(default_spec);
      if (e != model::ErrorKind::None) { print_error(e, "default affinity '" + default_spec + "'"); return exit_for(e); }
      return 0;
    }
    case Command::Reset: {
      auto rep = service.reset_all();
      std::cout << "Restored " << rep.processes_restored << " processes, " << rep.throttles_restored
                << " throttles; cpus brought online: "
                << (rep.cores_onlined.empty() ? "none" : util::format_cpulist(rep.cores_onlined)) << "\n";
      if (rep.error != model::ErrorKind::None) { print_error(rep.error, rep.detail); return 1; }
      return 0;
    }
    case Command::Run: {
      print_topology(service.classify());
      if (last_intent) {
        if (restore_gaming) {
          auto r = service.set_gaming_mode_sync(true);
          print_park(r.state);
        } else {
          LASSO_LOG_INFO("Main", "Gaming Mode was on at last exit; pass --restore-gaming-mode to re-enable it");
        }
      }
      if (iterations > 0) {
        // Deterministic: one scan and one governor tick per iteration
        auto now = std::chrono::steady_clock::now();
        auto gov_iv = service.config().probalance.interval;
        for (int i = 0; i < iterations && !g_stop.load(); ++i) {
          service.step(now);
          now += gov_iv;
          if (i + 1 < iterations) std::this_thread::sleep_for(gov_iv);
        }
      } else {
        service.start();
        while (!g_stop.load()) std::this_thread::sleep_for(100ms);
        service.stop();
      }
      auto throttled = service.governor_status();
      std::cout << "Throttled: " << throttled.size() << "\n";
      for (const auto& t : throttled)
        std::cout << "  " << t.name << "(" << t.pid << ") nice " << t.original_nice << "->" << t.current_nice << "\n";
      // Throttles exist only while the governor runs to lift them
      service.restore_throttles();
      return 0;
    }
    case Command::None:
      break;
  }
  return 0;
}
