#pragma once
#include "app/Executor.hpp"
#include "app/ProBalance.hpp"
#include "app/RuleEngine.hpp"
#include "model/Rules.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lasso::app {

// Everything persisted in config.toml. Values resolve TOML -> env -> default.
struct LassoConfig {
  GovernorConfig probalance{};
  std::optional<DefaultAffinity> default_affinity;
  bool gaming_last_intent{false};
  bool gaming_elevate_nice{false};
  ExecutorOptions executor{};
  std::chrono::milliseconds scan_interval{500};
  std::string log_level{"info"};
  std::vector<model::AffinityRule> rules;
};

// $XDG_CONFIG_HOME/lasso/config.toml, else ~/.config/lasso/config.toml
std::string config_file_path();

// A missing or unreadable file yields defaults. Bad values fall back per key.
LassoConfig load_config(const std::string& path);

// Atomic replace. False if the file could not be written.
bool save_config(const LassoConfig& cfg, const std::string& path);

// Env helpers shared with the CLI
const char* getenv_nonempty(const char* name);
int getenv_int(const char* name, int defv);

} // namespace lasso::app
