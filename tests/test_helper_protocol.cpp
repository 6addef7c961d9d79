#include "minitest.hpp"
#include "fakes.hpp"
#include "helper/Apply.hpp"
#include "helper/Protocol.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace lasso;
using helper::ExecutorRequest;
using helper::Op;
using lasso::testing::TempDir;
using model::ErrorKind;

TEST(protocol_encode_shapes) {
  auto a = helper::encode(ExecutorRequest::park(12));
  ASSERT_EQ(a.size(), 2u);
  ASSERT_EQ(a[0], "park");
  ASSERT_EQ(a[1], "12");
  auto b = helper::encode(ExecutorRequest::set_priority(4242, -5, model::IoPriority{model::IoClass::BestEffort, 7}));
  ASSERT_EQ(b.size(), 4u);
  ASSERT_EQ(b[0], "setpriority");
  ASSERT_EQ(b[2], "-5");
  ASSERT_EQ(b[3], "be:7");
}

TEST(protocol_decode_accepts_encoded_requests) {
  std::string err;
  auto r = helper::decode({"unpark", "7"}, err);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->op, Op::Unpark);
  ASSERT_EQ(r->core, 7);
  auto p = helper::decode({"setpriority", "100", "19", "idle"}, err);
  ASSERT_TRUE(p.has_value());
  ASSERT_EQ(p->pid, 100);
  ASSERT_EQ(p->nice, 19);
  ASSERT_EQ(p->io.io_class, model::IoClass::Idle);
}

TEST(protocol_decode_rejects_malformed) {
  std::string err;
  ASSERT_FALSE(helper::decode({}, err).has_value());
  ASSERT_FALSE(helper::decode({"park"}, err).has_value());
  ASSERT_FALSE(helper::decode({"park", "-1"}, err).has_value());
  ASSERT_FALSE(helper::decode({"park", "8192"}, err).has_value());
  ASSERT_FALSE(helper::decode({"park", "3", "extra"}, err).has_value());
  ASSERT_FALSE(helper::decode({"park", "0x3"}, err).has_value());
  ASSERT_FALSE(helper::decode({"setpriority", "0", "0", "none"}, err).has_value());
  ASSERT_FALSE(helper::decode({"setpriority", "10", "20", "none"}, err).has_value());
  ASSERT_FALSE(helper::decode({"setpriority", "10", "-21", "none"}, err).has_value());
  ASSERT_FALSE(helper::decode({"setpriority", "10", "0", "be:9"}, err).has_value());
  ASSERT_FALSE(helper::decode({"reboot"}, err).has_value());
  ASSERT_TRUE(err.find("reboot") != std::string::npos);
}

TEST(protocol_exit_codes_map_both_ways) {
  for (auto k : {ErrorKind::None, ErrorKind::InvalidRequest, ErrorKind::PermissionDenied,
                 ErrorKind::TargetNotFound, ErrorKind::WriteFailed}) {
    ASSERT_EQ(helper::error_for_exit_code(helper::exit_code_for(k)), k);
  }
  ASSERT_EQ(helper::exit_code_for(ErrorKind::TargetNotFound), 4);
  ASSERT_EQ(helper::error_for_exit_code(99), ErrorKind::WriteFailed);
}

namespace {

struct CpuDir {
  TempDir dir{"helper"};
  void core(int c) const {
    auto d = dir.path() / ("cpu" + std::to_string(c));
    fs::create_directories(d);
    std::ofstream(d / "online") << "1\n";
  }
  std::string online(int c) const {
    std::ifstream in(dir.path() / ("cpu" + std::to_string(c)) / "online");
    std::string s;
    std::getline(in, s);
    return s;
  }
};

} // namespace

TEST(helper_park_and_unpark_write_online_file) {
  CpuDir cpus;
  cpus.core(3);
  helper::HelperPaths paths;
  paths.cpu_dir = cpus.dir.str();
  ASSERT_TRUE(helper::execute_request(ExecutorRequest::park(3), paths).ok());
  ASSERT_EQ(cpus.online(3), "0");
  ASSERT_TRUE(helper::execute_request(ExecutorRequest::unpark(3), paths).ok());
  ASSERT_EQ(cpus.online(3), "1");
}

TEST(helper_missing_core_is_target_not_found) {
  CpuDir cpus;
  helper::HelperPaths paths;
  paths.cpu_dir = cpus.dir.str();
  auto r = helper::execute_request(ExecutorRequest::park(5), paths);
  ASSERT_EQ(r.error, ErrorKind::TargetNotFound);
}

TEST(helper_rejects_out_of_range_requests) {
  ASSERT_EQ(helper::execute_request(ExecutorRequest::park(9000)).error, ErrorKind::InvalidRequest);
  ASSERT_EQ(helper::execute_request(ExecutorRequest::set_priority(100, 25, {})).error, ErrorKind::InvalidRequest);
  ASSERT_EQ(helper::execute_request(ExecutorRequest::set_priority(-3, 0, {})).error, ErrorKind::InvalidRequest);
}

TEST(helper_missing_pid_is_target_not_found) {
  TempDir proc("helper_proc");
  helper::HelperPaths paths;
  paths.proc_dir = proc.str();
  auto r = helper::execute_request(ExecutorRequest::set_priority(31337, 5, {}), paths);
  ASSERT_EQ(r.error, ErrorKind::TargetNotFound);
}
