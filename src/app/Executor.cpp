#include "app/Executor.hpp"
#include "util/Log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

namespace lasso::app {

using model::ErrorKind;

SudoExecutor::SudoExecutor(ExecutorOptions opts) : opts_(std::move(opts)) {}

bool helper_installed(const std::string& path) {
  return !path.empty() && ::access(path.c_str(), X_OK) == 0;
}

bool SudoExecutor::helper_installed() const {
  return app::helper_installed(opts_.helper_path);
}

static std::string trim_stderr(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  auto nl = s.rfind('\n');
  if (nl != std::string::npos) s = s.substr(nl + 1);
  // Drop the helper's own prefix, keep the detail
  const std::string prefix = "lasso-helper: ";
  if (s.rfind(prefix, 0) == 0) s = s.substr(prefix.size());
  return s;
}

ExecutorResponse SudoExecutor::execute(const ExecutorRequest& req) {
  if (!helper_installed())
    return ExecutorResponse::failure(ErrorKind::PermissionDenied, "helper not installed at " + opts_.helper_path);

  std::vector<std::string> argv_s;
  if (opts_.use_sudo) { argv_s.push_back(opts_.sudo_path); argv_s.push_back("-n"); }
  argv_s.push_back(opts_.helper_path);
  for (auto& a : helper::encode(req)) argv_s.push_back(std::move(a));
  std::vector<char*> argv;
  for (auto& a : argv_s) argv.push_back(a.data());
  argv.push_back(nullptr);

  int errpipe[2];
  if (::pipe2(errpipe, O_CLOEXEC) != 0)
    return ExecutorResponse::failure(ErrorKind::WriteFailed, std::string("pipe: ") + std::strerror(errno));

  LASSO_LOG_DEBUG("Executor", "running %s %s", helper::to_string(req.op), opts_.helper_path.c_str());
  pid_t child = ::fork();
  if (child < 0) {
    int err = errno;
    ::close(errpipe[0]); ::close(errpipe[1]);
    return ExecutorResponse::failure(ErrorKind::WriteFailed, std::string("fork: ") + std::strerror(err));
  }
  if (child == 0) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
    ::dup2(errpipe[1], STDERR_FILENO);
    ::execv(argv[0], argv.data());
    _exit(127);
  }
  ::close(errpipe[1]);

  const auto deadline = std::chrono::steady_clock::now() + opts_.timeout;
  auto remaining_ms = [&]() -> int {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
  };

  std::string err_text;
  bool timed_out = false;
  for (;;) {
    int wait_ms = remaining_ms();
    if (wait_ms == 0) { timed_out = true; break; }
    pollfd pfd{errpipe[0], POLLIN, 0};
    int pr = ::poll(&pfd, 1, wait_ms);
    if (pr < 0 && errno == EINTR) continue;
    if (pr <= 0) { timed_out = (pr == 0); break; }
    char buf[512];
    ssize_t n = ::read(errpipe[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;  // EOF: child closed stderr
    if (err_text.size() < 4096) err_text.append(buf, static_cast<size_t>(n));
  }
  ::close(errpipe[0]);

  int status = 0;
  while (!timed_out) {
    pid_t w = ::waitpid(child, &status, WNOHANG);
    if (w == child) break;
    if (w < 0 && errno != EINTR) break;
    if (remaining_ms() == 0) { timed_out = true; break; }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  if (timed_out) {
    ::kill(child, SIGKILL);
    while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {}
    return ExecutorResponse::failure(ErrorKind::WriteFailed,
        std::string(helper::to_string(req.op)) + " timed out after " + std::to_string(opts_.timeout.count()) + " ms");
  }

  if (!WIFEXITED(status))
    return ExecutorResponse::failure(ErrorKind::WriteFailed, "helper terminated by signal");
  int code = WEXITSTATUS(status);
  if (code == helper::kExitOk) return ExecutorResponse::success();
  std::string detail = trim_stderr(err_text);
  // sudo itself exits 1 when no rule allows the call; 127 means exec failed
  if (code == 1 || code == 127) {
    if (detail.empty()) detail = opts_.use_sudo ? "sudo refused to run the helper" : "helper could not be executed";
    return ExecutorResponse::failure(ErrorKind::PermissionDenied, detail);
  }
  return ExecutorResponse::failure(helper::error_for_exit_code(code), detail);
}

void report_failure(const char* component, const ExecutorResponse& resp, const std::string& what) {
  const char* kind = model::to_string(resp.error);
  switch (resp.error) {
    case ErrorKind::None:
      return;
    case ErrorKind::PermissionDenied:
      util::log(util::LogLevel::Error, component, "%s: %s: %s (hint: %s)", what.c_str(), kind, resp.detail.c_str(),
                model::remediation_hint(resp.error));
      return;
    case ErrorKind::TargetNotFound:
      util::log(util::LogLevel::Debug, component, "%s: %s: %s", what.c_str(), kind, resp.detail.c_str());
      return;
    case ErrorKind::Unsupported:
      util::log(util::LogLevel::Info, component, "%s: %s: %s", what.c_str(), kind, resp.detail.c_str());
      return;
    case ErrorKind::InvalidRequest:
    case ErrorKind::WriteFailed:
      util::log(util::LogLevel::Warn, component, "%s: %s: %s", what.c_str(), kind, resp.detail.c_str());
      return;
  }
}

} // namespace lasso::app
