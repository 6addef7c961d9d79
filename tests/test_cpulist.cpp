#include "minitest.hpp"
#include "util/CpuList.hpp"

using lasso::util::format_cpulist;
using lasso::util::parse_cpulist;

TEST(cpulist_parse_ranges_and_singles) {
  auto s = parse_cpulist("0-3,8,10-11\n");
  ASSERT_TRUE(s.has_value());
  ASSERT_EQ(*s, (std::set<int>{0, 1, 2, 3, 8, 10, 11}));
}

TEST(cpulist_empty_is_empty_set) {
  auto s = parse_cpulist("  ");
  ASSERT_TRUE(s.has_value());
  ASSERT_TRUE(s->empty());
}

TEST(cpulist_rejects_malformed) {
  ASSERT_FALSE(parse_cpulist("3-1").has_value());
  ASSERT_FALSE(parse_cpulist("1,").has_value());
  ASSERT_FALSE(parse_cpulist("a-b").has_value());
  ASSERT_FALSE(parse_cpulist("-1").has_value());
  ASSERT_FALSE(parse_cpulist("9000").has_value());
}

TEST(cpulist_format_collapses_runs) {
  ASSERT_EQ(format_cpulist({0, 1, 2, 3, 5, 7, 8}), "0-3,5,7-8");
  ASSERT_EQ(format_cpulist({}), "");
  ASSERT_EQ(format_cpulist({4}), "4");
}

TEST(cpulist_kernel_online_file_shape) {
  auto s = parse_cpulist("0-7,16-23");
  ASSERT_TRUE(s.has_value());
  ASSERT_EQ(s->size(), 16u);
  ASSERT_EQ(format_cpulist(*s), "0-7,16-23");
}
