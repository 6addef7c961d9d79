#include "minitest.hpp"
#include "fakes.hpp"
#include "collectors/CpuCollector.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using lasso::testing::ScopedEnv;
using lasso::testing::TempDir;

TEST(cpu_collector_delta_usage) {
  TempDir root("cpu");
  fs::create_directories(root.path() / "proc");
  ScopedEnv env("LASSO_PROC_ROOT", root.str());
  // First sample
  std::ofstream(root.path() / "proc/stat") << "cpu  100 0 100 1000 0 0 0 0\n"
                                               "cpu0 100 0 100 1000 0 0 0 0\n";
  lasso::collectors::CpuCollector c; lasso::model::CpuSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.usage_pct, 0.0);
  // Second sample with more work and total
  std::ofstream(root.path() / "proc/stat") << "cpu  150 0 150 1100 0 0 0 0\n"
                                               "cpu0 150 0 150 1100 0 0 0 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_TRUE(s.usage_pct > 40.0 && s.usage_pct < 60.0);
  ASSERT_EQ(s.online_cores, 1);
}

TEST(cpu_collector_core_count_change_zeroes_per_core) {
  TempDir root("cpu");
  fs::create_directories(root.path() / "proc");
  ScopedEnv env("LASSO_PROC_ROOT", root.str());
  std::ofstream(root.path() / "proc/stat") << "cpu  200 0 0 200 0 0 0 0\n"
                                               "cpu0 100 0 0 100 0 0 0 0\n"
                                               "cpu1 100 0 0 100 0 0 0 0\n"
                                               "intr 0\n";
  lasso::collectors::CpuCollector c; lasso::model::CpuSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.online_cores, 2);
  // cpu1 went offline
  std::ofstream(root.path() / "proc/stat") << "cpu  300 0 0 300 0 0 0 0\n"
                                               "cpu0 200 0 0 200 0 0 0 0\n"
                                               "intr 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.online_cores, 1);
  ASSERT_EQ(s.per_core_pct.size(), 1u);
  ASSERT_EQ(s.per_core_pct[0], 0.0);
  ASSERT_TRUE(s.usage_pct > 49.0 && s.usage_pct < 51.0);
}

TEST(cpu_collector_missing_stat_fails) {
  TempDir root("cpu");
  ScopedEnv env("LASSO_PROC_ROOT", root.str());
  lasso::collectors::CpuCollector c; lasso::model::CpuSnapshot s{};
  ASSERT_FALSE(c.sample(s));
}
