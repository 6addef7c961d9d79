#include "minitest.hpp"
#include "fakes.hpp"
#include "app/Executor.hpp"

#include <sys/stat.h>

#include <chrono>
#include <fstream>

using namespace lasso;
using app::ExecutorOptions;
using app::SudoExecutor;
using helper::ExecutorRequest;
using lasso::testing::TempDir;
using model::ErrorKind;

// A stand-in helper: a shell script run without sudo
static std::string script(const TempDir& dir, const std::string& name, const std::string& body) {
  auto path = dir.str() + "/" + name;
  {
    std::ofstream f(path);
    f << "#!/bin/sh\n" << body << "\n";
  }
  ::chmod(path.c_str(), 0755);
  return path;
}

static ExecutorOptions direct(const std::string& helper, int timeout_ms = 3000) {
  ExecutorOptions o;
  o.helper_path = helper;
  o.use_sudo = false;
  o.timeout = std::chrono::milliseconds(timeout_ms);
  return o;
}

TEST(executor_missing_helper_is_permission_denied) {
  SudoExecutor ex(direct("/nonexistent/lasso-helper"));
  ASSERT_FALSE(ex.helper_installed());
  auto r = ex.execute(ExecutorRequest::park(3));
  ASSERT_EQ(r.error, ErrorKind::PermissionDenied);
}

TEST(executor_success_exit) {
  TempDir dir("exec");
  SudoExecutor ex(direct(script(dir, "ok.sh", "exit 0")));
  ASSERT_TRUE(ex.helper_installed());
  ASSERT_TRUE(ex.execute(ExecutorRequest::unpark(2)).ok());
}

TEST(executor_maps_exit_code_and_detail) {
  TempDir dir("exec");
  SudoExecutor ex(direct(script(dir, "gone.sh", "echo \"lasso-helper: TargetNotFound: cpu$2 has no online control\" >&2\nexit 4")));
  auto r = ex.execute(ExecutorRequest::park(9));
  ASSERT_EQ(r.error, ErrorKind::TargetNotFound);
  ASSERT_EQ(r.detail, "TargetNotFound: cpu9 has no online control");
}

TEST(executor_passes_encoded_arguments) {
  TempDir dir("exec");
  // Succeeds only when argv matches the wire encoding
  SudoExecutor ex(direct(script(dir, "args.sh",
      "[ \"$1\" = setpriority ] && [ \"$2\" = 77 ] && [ \"$3\" = -1 ] && [ \"$4\" = be:3 ] && exit 0\nexit 2")));
  auto r = ex.execute(ExecutorRequest::set_priority(77, -1, model::IoPriority{model::IoClass::BestEffort, 3}));
  ASSERT_TRUE(r.ok());
  auto bad = ex.execute(ExecutorRequest::set_priority(78, -1, model::IoPriority{model::IoClass::BestEffort, 3}));
  ASSERT_EQ(bad.error, ErrorKind::InvalidRequest);
}

TEST(executor_sudo_refusal_is_permission_denied) {
  TempDir dir("exec");
  SudoExecutor ex(direct(script(dir, "refuse.sh", "echo 'sudo: a password is required' >&2\nexit 1")));
  auto r = ex.execute(ExecutorRequest::park(1));
  ASSERT_EQ(r.error, ErrorKind::PermissionDenied);
  ASSERT_TRUE(r.detail.find("password") != std::string::npos);
}

TEST(executor_timeout_kills_child) {
  TempDir dir("exec");
  SudoExecutor ex(direct(script(dir, "hang.sh", "exec sleep 5"), 200));
  auto t0 = std::chrono::steady_clock::now();
  auto r = ex.execute(ExecutorRequest::park(1));
  auto took = std::chrono::steady_clock::now() - t0;
  ASSERT_EQ(r.error, ErrorKind::WriteFailed);
  ASSERT_TRUE(r.detail.find("timed out") != std::string::npos);
  ASSERT_TRUE(took < std::chrono::seconds(3));
}
