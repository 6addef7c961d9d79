#pragma once
#include "helper/Protocol.hpp"

#include <chrono>
#include <string>

namespace lasso::app {

using helper::ExecutorRequest;
using helper::ExecutorResponse;

// Single entry point for every privileged write. Calls are synchronous and
// bounded by the implementation's timeout.
class IExecutor {
public:
  virtual ~IExecutor() = default;
  [[nodiscard]] virtual ExecutorResponse execute(const ExecutorRequest& req) = 0;
};

struct ExecutorOptions {
  std::string helper_path{"/usr/local/libexec/lasso-helper"};
  std::string sudo_path{"/usr/bin/sudo"};
  std::chrono::milliseconds timeout{3000};
  // When false the helper is exec'd directly (already running as root)
  bool use_sudo{true};
};

// Runs lasso-helper as a child process: sudo -n <helper> <argv...>.
// No shell is involved and sudo never prompts.
class SudoExecutor : public IExecutor {
public:
  explicit SudoExecutor(ExecutorOptions opts);
  ExecutorResponse execute(const ExecutorRequest& req) override;

  [[nodiscard]] bool helper_installed() const;
  [[nodiscard]] const ExecutorOptions& options() const { return opts_; }

private:
  ExecutorOptions opts_;
};

// True when path names an executable file
[[nodiscard]] bool helper_installed(const std::string& path);

// Log a failed operation at the severity its error kind warrants,
// appending the remediation hint for permission problems.
void report_failure(const char* component, const ExecutorResponse& resp, const std::string& what);

} // namespace lasso::app
