// In-memory stand-ins for every privileged seam
#pragma once
#include "app/Executor.hpp"
#include "app/ProcessControl.hpp"
#include "collectors/ICoreProbe.hpp"
#include "collectors/IProcessCollector.hpp"

#include <unistd.h>

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lasso::testing {

// Sets an environment variable for the lifetime of the guard
class ScopedEnv {
public:
  ScopedEnv(const char* name, const std::string& value) : name_(name) {
    if (const char* old = std::getenv(name)) { had_ = true; old_ = old; }
    ::setenv(name, value.c_str(), 1);
  }
  ~ScopedEnv() {
    if (had_) ::setenv(name_, old_.c_str(), 1); else ::unsetenv(name_);
  }
private:
  const char* name_;
  bool had_{false};
  std::string old_;
};

// Unique scratch directory removed on destruction
class TempDir {
public:
  explicit TempDir(const std::string& tag) {
    static int counter = 0;
    path_ = std::filesystem::temp_directory_path() /
            ("lasso_test_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.string(); }
private:
  std::filesystem::path path_;
};

// Simulates the kernel's online map. Park/unpark requests flip it.
class FakeCores : public collectors::ICoreProbe {
public:
  explicit FakeCores(int ncpu, bool boot_cpu_fixed = true) : boot_cpu_fixed_(boot_cpu_fixed) {
    for (int c = 0; c < ncpu; ++c) online_[c] = true;
  }

  model::CoreSet online_cores() override {
    std::lock_guard<std::mutex> lk(mu_);
    model::CoreSet s;
    for (auto [c, on] : online_) if (on) s.insert(c);
    return s;
  }
  model::CoreSet offline_cores() override {
    std::lock_guard<std::mutex> lk(mu_);
    model::CoreSet s;
    for (auto [c, on] : online_) if (!on) s.insert(c);
    return s;
  }
  // CPU 0 is the boot CPU and has no online control
  bool is_hotpluggable(model::CoreId id) override {
    std::lock_guard<std::mutex> lk(mu_);
    return (!boot_cpu_fixed_ || id != 0) && online_.count(id) > 0;
  }

  void set_online(model::CoreId c, bool on) {
    std::lock_guard<std::mutex> lk(mu_);
    online_[c] = on;
  }

private:
  bool boot_cpu_fixed_;
  std::mutex mu_;
  std::map<model::CoreId, bool> online_;
};

// Records every request; optionally fails the Nth one or blocks inside a call.
class FakeExecutor : public app::IExecutor {
public:
  explicit FakeExecutor(FakeCores* cores = nullptr) : cores_(cores) {}

  app::ExecutorResponse execute(const app::ExecutorRequest& req) override {
    std::function<void(const app::ExecutorRequest&)> hook;
    size_t n;
    {
      std::lock_guard<std::mutex> lk(mu_);
      log_.push_back(req);
      n = log_.size();
      hook = on_call;
    }
    if (hook) hook(req);
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (fail_at == n || (fail_op && *fail_op == req.op && fail_core == req.core))
        return app::ExecutorResponse::failure(fail_kind, "injected failure");
    }
    if (cores_ && (req.op == helper::Op::Park || req.op == helper::Op::Unpark))
      cores_->set_online(req.core, req.op == helper::Op::Unpark);
    return app::ExecutorResponse::success();
  }

  std::vector<app::ExecutorRequest> calls() {
    std::lock_guard<std::mutex> lk(mu_);
    return log_;
  }
  size_t count(helper::Op op) {
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = 0;
    for (const auto& r : log_) if (r.op == op) ++n;
    return n;
  }

  size_t fail_at{0};  // 1-based call index; 0 = never
  std::optional<helper::Op> fail_op;
  model::CoreId fail_core{-1};
  model::ErrorKind fail_kind{model::ErrorKind::WriteFailed};
  std::function<void(const app::ExecutorRequest&)> on_call;

private:
  FakeCores* cores_;
  std::mutex mu_;
  std::vector<app::ExecutorRequest> log_;
};

// Nice, ioprio and affinity tables keyed by pid
class FakeProcessControl : public app::IProcessControl {
public:
  struct Entry { uint64_t start_time{0}; int nice{0}; model::IoPriority io{}; model::CoreSet affinity; };

  void add(int32_t pid, int nice = 0, model::CoreSet affinity = {0, 1, 2, 3, 4, 5, 6, 7}) {
    std::lock_guard<std::mutex> lk(mu_);
    procs_[pid] = Entry{0, nice, model::IoPriority{model::IoClass::None, 0}, std::move(affinity)};
  }
  void kill(int32_t pid) {
    std::lock_guard<std::mutex> lk(mu_);
    procs_.erase(pid);
  }
  Entry get(int32_t pid) {
    std::lock_guard<std::mutex> lk(mu_);
    return procs_.at(pid);
  }

  bool pid_alive(int32_t pid, uint64_t) override {
    std::lock_guard<std::mutex> lk(mu_);
    return procs_.count(pid) > 0;
  }
  std::optional<int> get_nice(int32_t pid) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = procs_.find(pid);
    if (it == procs_.end()) return std::nullopt;
    return it->second.nice;
  }
  std::optional<model::IoPriority> get_io(int32_t pid) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = procs_.find(pid);
    if (it == procs_.end()) return std::nullopt;
    return it->second.io;
  }
  std::optional<model::CoreSet> get_affinity(int32_t pid) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = procs_.find(pid);
    if (it == procs_.end()) return std::nullopt;
    return it->second.affinity;
  }
  app::ExecutorResponse set_priority(int32_t pid, int nice, const model::IoPriority& io) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++priority_writes;
    auto it = procs_.find(pid);
    if (it == procs_.end()) return app::ExecutorResponse::failure(model::ErrorKind::TargetNotFound, "gone");
    it->second.nice = nice;
    it->second.io = io;
    return app::ExecutorResponse::success();
  }
  app::ExecutorResponse set_affinity(int32_t pid, const model::CoreSet& cores) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++affinity_writes;
    auto it = procs_.find(pid);
    if (it == procs_.end()) return app::ExecutorResponse::failure(model::ErrorKind::TargetNotFound, "gone");
    it->second.affinity = cores;
    return app::ExecutorResponse::success();
  }

  int priority_writes{0};
  int affinity_writes{0};

private:
  std::mutex mu_;
  std::map<int32_t, Entry> procs_;
};

// Returns scripted snapshots in order, repeating the last one
class FakeProcessCollector : public collectors::IProcessCollector {
public:
  bool sample(model::ProcessSnapshot& out) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (script_.empty()) return false;
    out = script_.front();
    if (script_.size() > 1) script_.pop_front();
    return true;
  }
  const char* name() const override { return "fake"; }

  void push(std::vector<model::ProcessView> procs) {
    std::lock_guard<std::mutex> lk(mu_);
    model::ProcessSnapshot s;
    s.processes = std::move(procs);
    script_.push_back(std::move(s));
  }

private:
  std::mutex mu_;
  std::deque<model::ProcessSnapshot> script_;
};

inline model::ProcessView proc(int32_t pid, const std::string& name, double cpu = 0.0, int nice = 0) {
  model::ProcessView p;
  p.pid = pid;
  p.ppid = 1;
  p.start_time = 1000 + static_cast<uint64_t>(pid);
  p.comm = name.substr(0, 15);
  p.name = name;
  p.cpu_pct = cpu;
  p.nice = nice;
  return p;
}

} // namespace lasso::testing
