#include "minitest.hpp"
#include "fakes.hpp"
#include "collectors/ProcessCollector.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using lasso::collectors::ProcessCollector;
using lasso::testing::ScopedEnv;
using lasso::testing::TempDir;

static std::string stat_line(int pid, const std::string& comm, uint64_t utime, uint64_t stime, int nice,
                             uint64_t start) {
  return std::to_string(pid) + " (" + comm + ") S 1 " + std::to_string(pid) + " " + std::to_string(pid) +
         " 0 -1 4194304 100 0 0 0 " + std::to_string(utime) + " " + std::to_string(stime) +
         " 0 0 20 " + std::to_string(nice) + " 1 0 " + std::to_string(start) + " 1000 200\n";
}

TEST(proc_parse_stat_with_spaces_and_parens) {
  ProcessCollector::StatFields sf;
  ASSERT_TRUE(ProcessCollector::parse_stat_line(stat_line(4242, "my (weird) app", 11, 22, 5, 98765), sf));
  ASSERT_EQ(sf.comm, "my (weird) app");
  ASSERT_EQ(sf.ppid, 1);
  ASSERT_EQ(sf.utime, 11u);
  ASSERT_EQ(sf.stime, 22u);
  ASSERT_EQ(sf.nice, 5);
  ASSERT_EQ(sf.start_time, 98765u);
}

TEST(proc_parse_stat_negative_nice) {
  ProcessCollector::StatFields sf;
  ASSERT_TRUE(ProcessCollector::parse_stat_line(stat_line(7, "game", 0, 0, -5, 1), sf));
  ASSERT_EQ(sf.nice, -5);
}

TEST(proc_parse_stat_rejects_garbage) {
  ProcessCollector::StatFields sf;
  ASSERT_FALSE(ProcessCollector::parse_stat_line("12 no parens here", sf));
  ASSERT_FALSE(ProcessCollector::parse_stat_line("12 (short)", sf));
}

TEST(proc_resolve_wine_name) {
  ASSERT_EQ(ProcessCollector::resolve_name("Main", "Z:\\games\\poe\\PathOfExileSteam.exe"),
            "PathOfExileSteam.exe");
  ASSERT_EQ(ProcessCollector::resolve_name("Main", "C:\\Windows\\system32\\EXPLORER.EXE"), "EXPLORER.EXE");
  // Plain unix path: keep comm
  ASSERT_EQ(ProcessCollector::resolve_name("bash", "/usr/bin/bash"), "bash");
  ASSERT_EQ(ProcessCollector::resolve_name("steam", ""), "steam");
}

TEST(proc_resolve_truncated_comm) {
  ASSERT_EQ(ProcessCollector::resolve_name("steamwebhelper_", "/opt/steam/steamwebhelper_linux"),
            "steamwebhelper_linux");
  // argv0 basename not longer than comm: keep comm
  ASSERT_EQ(ProcessCollector::resolve_name("abcdefghijklmno", "/bin/short"), "abcdefghijklmno");
  ASSERT_EQ(ProcessCollector::resolve_name("fourteen_chars", "/bin/fourteen_chars_and_more"), "fourteen_chars");
}

namespace {

struct ProcTree {
  TempDir dir{"proc"};
  fs::path root() const { return dir.path() / "proc"; }

  void stat(const std::string& content) const {
    fs::create_directories(root());
    std::ofstream(root() / "stat") << content;
  }
  void process(int pid, const std::string& comm, uint64_t utime, uint64_t start, const std::string& argv = "") const {
    auto d = root() / std::to_string(pid);
    fs::create_directories(d);
    std::ofstream(d / "stat") << stat_line(pid, comm, utime, 0, 0, start);
    std::ofstream cmd(d / "cmdline", std::ios::binary);
    cmd << argv;
    cmd.put('\0');
  }
};

} // namespace

TEST(proc_sample_cpu_pct_per_core_scale) {
  ProcTree t;
  t.stat("cpu  500 0 0 500 0 0 0 0\ncpu0 250 0 0 250 0 0 0 0\ncpu1 250 0 0 250 0 0 0 0\n");
  t.process(100, "hog", 10, 5000, "/usr/bin/hog");
  t.process(101, "Main", 0, 5001, "Z:\\game\\Game.exe");
  ScopedEnv env("LASSO_PROC_ROOT", t.dir.str());

  ProcessCollector pc;
  lasso::model::ProcessSnapshot snap;
  ASSERT_TRUE(pc.sample(snap));
  ASSERT_EQ(snap.ncpu, 2u);
  ASSERT_EQ(snap.processes.size(), 2u);

  t.stat("cpu  600 0 0 600 0 0 0 0\ncpu0 300 0 0 300 0 0 0 0\ncpu1 300 0 0 300 0 0 0 0\n");
  t.process(100, "hog", 110, 5000, "/usr/bin/hog");
  ASSERT_TRUE(pc.sample(snap));
  for (const auto& p : snap.processes) {
    if (p.pid == 100) {
      // 100 jiffies of 200 total across 2 cores = one full core
      ASSERT_TRUE(p.cpu_pct > 99.0 && p.cpu_pct < 101.0);
      ASSERT_EQ(p.name, "hog");
    } else {
      ASSERT_EQ(p.cpu_pct, 0.0);
      ASSERT_EQ(p.name, "Game.exe");
      ASSERT_EQ(p.comm, "Main");
    }
  }
}

TEST(proc_sample_reused_pid_does_not_inherit_usage) {
  ProcTree t;
  t.stat("cpu  500 0 0 500 0 0 0 0\ncpu0 500 0 0 500 0 0 0 0\n");
  t.process(300, "old", 10, 7000);
  ScopedEnv env("LASSO_PROC_ROOT", t.dir.str());

  ProcessCollector pc;
  lasso::model::ProcessSnapshot snap;
  ASSERT_TRUE(pc.sample(snap));
  // Same pid, new owner: smaller total and a different start time
  t.stat("cpu  600 0 0 600 0 0 0 0\ncpu0 600 0 0 600 0 0 0 0\n");
  t.process(300, "new", 500, 9000);
  ASSERT_TRUE(pc.sample(snap));
  ASSERT_EQ(snap.processes.size(), 1u);
  ASSERT_EQ(snap.processes[0].name, "new");
  ASSERT_EQ(snap.processes[0].start_time, 9000u);
  ASSERT_EQ(snap.processes[0].cpu_pct, 0.0);
}
