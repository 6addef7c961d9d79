#pragma once
#include "helper/Protocol.hpp"
#include <string>

namespace lasso::helper {

// Filesystem locations the helper writes through. The installed binary always
// uses the defaults; tests point them at a scratch tree.
struct HelperPaths {
  std::string cpu_dir{"/sys/devices/system/cpu"};
  std::string proc_dir{"/proc"};
};

// Perform exactly one kernel-facing write. Stateless.
[[nodiscard]] ExecutorResponse execute_request(const ExecutorRequest& req, const HelperPaths& paths = {});

} // namespace lasso::helper
