#include "minitest.hpp"
#include "fakes.hpp"
#include "app/Classifier.hpp"
#include "collectors/CpuTopologyCollector.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace lasso;
using lasso::testing::ScopedEnv;
using lasso::testing::TempDir;
using model::Tristate;

namespace {

// Fake /sys/devices/system/cpu tree
struct SysTree {
  TempDir dir{"sys"};
  fs::path cpu_root() const { return dir.path() / "sys/devices/system/cpu"; }

  void write(const fs::path& p, const std::string& content) const {
    fs::create_directories(p.parent_path());
    std::ofstream(p) << content << "\n";
  }
  void lists(const std::string& present, const std::string& online, const std::string& offline) const {
    write(cpu_root() / "present", present);
    write(cpu_root() / "online", online);
    write(cpu_root() / "offline", offline);
  }
  void core(int cpu, long long max_khz, bool hotplug = true) const {
    auto base = cpu_root() / ("cpu" + std::to_string(cpu));
    fs::create_directories(base);
    if (max_khz > 0) write(base / "cpufreq/cpuinfo_max_freq", std::to_string(max_khz));
    if (hotplug) write(base / "online", "1");
  }
  void l3(int cpu, const std::string& size, int id, const std::string& shared = "") const {
    auto base = cpu_root() / ("cpu" + std::to_string(cpu)) / "cache";
    write(base / "index0/level", "1");
    write(base / "index0/size", "32K");
    write(base / "index3/level", "3");
    write(base / "index3/size", size);
    if (id >= 0) write(base / "index3/id", std::to_string(id));
    if (!shared.empty()) write(base / "index3/shared_cpu_list", shared);
  }
};

} // namespace

TEST(topology_reads_cache_asymmetry) {
  SysTree t;
  t.lists("0-3", "0-3", "");
  for (int c = 0; c < 4; ++c) {
    t.core(c, 5000000, c != 0);
    t.l3(c, c < 2 ? "98304K" : "32768K", c < 2 ? 0 : 1);
  }
  ScopedEnv env("LASSO_SYS_ROOT", t.dir.str());
  collectors::CpuTopologyCollector col;
  auto facts = col.collect();
  ASSERT_EQ(facts.size(), 4u);
  ASSERT_EQ(facts[0].cache_group_size_bytes, 96ull << 20);
  ASSERT_EQ(facts[3].cache_group_id, 1);
  ASSERT_EQ(facts[1].max_frequency_hz, 5000000000ull);

  auto topo = app::classify(facts);
  ASSERT_EQ(topo.reason, model::ClassificationReason::CacheAsymmetricCCD);
  ASSERT_EQ(topo.preferred, (model::CoreSet{0, 1}));
  ASSERT_EQ(topo.non_preferred, (model::CoreSet{2, 3}));
}

TEST(topology_shared_cpu_list_names_group) {
  SysTree t;
  t.lists("0-3", "0-3", "");
  for (int c = 0; c < 4; ++c) {
    t.core(c, 0);
    t.l3(c, "16M", -1, c < 2 ? "0-1" : "2-3");
  }
  ScopedEnv env("LASSO_SYS_ROOT", t.dir.str());
  collectors::CpuTopologyCollector col;
  auto facts = col.collect();
  ASSERT_EQ(facts.size(), 4u);
  ASSERT_EQ(facts[1].cache_group_id, 0);
  ASSERT_EQ(facts[2].cache_group_id, 2);
  ASSERT_EQ(facts[2].cache_group_size_bytes, 16ull << 20);
  ASSERT_EQ(facts[0].max_frequency_hz, 0ull);
}

TEST(topology_hybrid_pmu_lists) {
  SysTree t;
  t.lists("0-5", "0-5", "");
  for (int c = 0; c < 6; ++c) t.core(c, 4000000);
  t.write(t.dir.path() / "sys/devices/cpu_core/cpus", "0-3");
  t.write(t.dir.path() / "sys/devices/cpu_atom/cpus", "4-5");
  ScopedEnv env("LASSO_SYS_ROOT", t.dir.str());
  collectors::CpuTopologyCollector col;
  auto facts = col.collect();
  ASSERT_EQ(facts.size(), 6u);
  ASSERT_EQ(facts[0].is_efficiency_core, Tristate::False);
  ASSERT_EQ(facts[5].is_efficiency_core, Tristate::True);
  auto topo = app::classify(facts);
  ASSERT_EQ(topo.reason, model::ClassificationReason::HybridPCoreECore);
  ASSERT_EQ(topo.non_preferred, (model::CoreSet{4, 5}));
}

TEST(topology_frequency_fallback) {
  SysTree t;
  t.lists("0-3", "0-3", "");
  t.core(0, 5400000); t.core(1, 5400000);
  t.core(2, 3800000); t.core(3, 3800000);
  ScopedEnv env("LASSO_SYS_ROOT", t.dir.str());
  collectors::CpuTopologyCollector col;
  auto facts = col.collect();
  ASSERT_EQ(facts[1].is_efficiency_core, Tristate::False);
  ASSERT_EQ(facts[2].is_efficiency_core, Tristate::True);
}

TEST(topology_close_frequencies_stay_unknown) {
  SysTree t;
  t.lists("0-1", "0-1", "");
  t.core(0, 5000000); t.core(1, 4600000);
  ScopedEnv env("LASSO_SYS_ROOT", t.dir.str());
  collectors::CpuTopologyCollector col;
  auto facts = col.collect();
  ASSERT_EQ(facts[0].is_efficiency_core, Tristate::Unknown);
  ASSERT_EQ(facts[1].is_efficiency_core, Tristate::Unknown);
  ASSERT_FALSE(app::classify(facts).has_asymmetry);
}

TEST(topology_online_offline_and_hotplug) {
  SysTree t;
  t.lists("0-7", "0-3", "4-7");
  for (int c = 0; c < 8; ++c) t.core(c, 0, c != 0);
  ScopedEnv env("LASSO_SYS_ROOT", t.dir.str());
  collectors::CpuTopologyCollector col;
  ASSERT_EQ(col.present_cores().size(), 8u);
  ASSERT_EQ(col.online_cores(), (model::CoreSet{0, 1, 2, 3}));
  ASSERT_EQ(col.offline_cores(), (model::CoreSet{4, 5, 6, 7}));
  ASSERT_FALSE(col.is_hotpluggable(0));
  ASSERT_TRUE(col.is_hotpluggable(5));
  ASSERT_FALSE(col.is_hotpluggable(42));
}

TEST(topology_missing_tree_yields_no_facts) {
  TempDir empty("sys");
  ScopedEnv env("LASSO_SYS_ROOT", empty.str());
  collectors::CpuTopologyCollector col;
  ASSERT_TRUE(col.collect().empty());
  ASSERT_TRUE(col.online_cores().empty());
}
