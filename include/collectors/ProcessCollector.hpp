#pragma once
#include "collectors/IProcessCollector.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

namespace lasso::collectors {

class ProcessCollector : public IProcessCollector {
public:
  ProcessCollector() = default;
  const char* name() const override { return "/proc scanner"; }
  bool sample(model::ProcessSnapshot& out) override;

  struct StatFields {
    int32_t ppid{};
    uint64_t utime{}, stime{};
    int nice{};
    uint64_t start_time{};
    std::string comm;
  };
  // Parse one /proc/<pid>/stat line. comm may contain spaces and ')'.
  static bool parse_stat_line(const std::string& content, StatFields& out);

  // Display name: Wine/Proton images resolve to the .exe basename and
  // truncated comm values to the argv[0] basename.
  static std::string resolve_name(const std::string& comm, const std::string& argv0);

private:
  struct Seen { uint64_t start_time; uint64_t total_time; };
  std::unordered_map<int32_t, Seen> last_per_proc_{};
  uint64_t last_cpu_total_{};
  bool have_last_{false};
  unsigned ncpu_{0};

  // pid -> (start_time, resolved name); argv is read once per process lifetime
  std::unordered_map<int32_t, std::pair<uint64_t, std::string>> names_{};

  static std::string read_argv0(int32_t pid);
};

} // namespace lasso::collectors
