#include "app/ProcessControl.hpp"
#include "collectors/ProcessCollector.hpp"
#include "util/Ioprio.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <sched.h>
#include <sys/resource.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <vector>

namespace lasso::app {

using model::ErrorKind;

static std::vector<int> task_ids(int32_t pid) {
  std::vector<int> tids;
  for (const auto& e : util::list_dir("/proc/" + std::to_string(pid) + "/task")) {
    int tid = 0;
    auto [ptr, ec] = std::from_chars(e.data(), e.data() + e.size(), tid);
    if (ec == std::errc{} && ptr == e.data() + e.size()) tids.push_back(tid);
  }
  return tids;
}

static ErrorKind errno_kind(int err) {
  if (err == ESRCH) return ErrorKind::TargetNotFound;
  if (err == EPERM || err == EACCES) return ErrorKind::PermissionDenied;
  if (err == EINVAL) return ErrorKind::InvalidRequest;
  return ErrorKind::WriteFailed;
}

bool SystemProcessControl::pid_alive(int32_t pid, uint64_t start_time) {
  auto content = util::read_file_string("/proc/" + std::to_string(pid) + "/stat");
  if (!content) return false;
  collectors::ProcessCollector::StatFields sf;
  if (!collectors::ProcessCollector::parse_stat_line(*content, sf)) return false;
  return start_time == 0 || sf.start_time == start_time;
}

std::optional<int> SystemProcessControl::get_nice(int32_t pid) {
  errno = 0;
  int v = ::getpriority(PRIO_PROCESS, static_cast<id_t>(pid));
  if (v == -1 && errno != 0) return std::nullopt;
  return v;
}

std::optional<model::IoPriority> SystemProcessControl::get_io(int32_t pid) {
  model::IoPriority p;
  if (util::ioprio_get_thread(pid, p) != 0) return std::nullopt;
  return p;
}

std::optional<model::CoreSet> SystemProcessControl::get_affinity(int32_t pid) {
  cpu_set_t set;
  CPU_ZERO(&set);
  if (::sched_getaffinity(pid, sizeof(set), &set) != 0) return std::nullopt;
  model::CoreSet out;
  for (int c = 0; c < CPU_SETSIZE; ++c)
    if (CPU_ISSET(c, &set)) out.insert(c);
  return out;
}

ExecutorResponse SystemProcessControl::set_priority(int32_t pid, int nice, const model::IoPriority& io) {
  if (nice < model::kNiceMin || nice > model::kNiceMax)
    return ExecutorResponse::failure(ErrorKind::InvalidRequest, "nice out of range");
  auto tids = task_ids(pid);
  if (tids.empty())
    return ExecutorResponse::failure(ErrorKind::TargetNotFound, "pid " + std::to_string(pid) + " not found");

  int first_err = 0;
  size_t applied = 0;
  for (int tid : tids) {
    if (::setpriority(PRIO_PROCESS, static_cast<id_t>(tid), nice) != 0 ||
        util::ioprio_set_thread(tid, io) != 0) {
      if (errno == ESRCH) continue;
      first_err = errno;
      break;
    }
    ++applied;
  }
  if (first_err == 0) {
    if (applied == 0) return ExecutorResponse::failure(ErrorKind::TargetNotFound, "pid " + std::to_string(pid) + " exited");
    return ExecutorResponse::success();
  }
  // Lowering nice or raising IO class needs privilege; hand it to the helper
  if ((first_err == EPERM || first_err == EACCES) && executor_) {
    LASSO_LOG_DEBUG("ProcessControl", "pid %d: unprivileged setpriority refused, using helper", pid);
    return executor_->execute(ExecutorRequest::set_priority(pid, nice, io));
  }
  return ExecutorResponse::failure(errno_kind(first_err), "pid " + std::to_string(pid) + ": " + std::strerror(first_err));
}

ExecutorResponse SystemProcessControl::set_affinity(int32_t pid, const model::CoreSet& cores) {
  if (cores.empty())
    return ExecutorResponse::failure(ErrorKind::InvalidRequest, "empty core set");
  cpu_set_t set;
  CPU_ZERO(&set);
  for (int c : cores) {
    if (c < 0 || c >= CPU_SETSIZE) return ExecutorResponse::failure(ErrorKind::InvalidRequest, "core id out of range");
    CPU_SET(c, &set);
  }
  auto tids = task_ids(pid);
  if (tids.empty())
    return ExecutorResponse::failure(ErrorKind::TargetNotFound, "pid " + std::to_string(pid) + " not found");
  size_t applied = 0;
  for (int tid : tids) {
    if (::sched_setaffinity(tid, sizeof(set), &set) != 0) {
      int err = errno;
      if (err == ESRCH) continue;
      return ExecutorResponse::failure(errno_kind(err), "pid " + std::to_string(pid) + ": " + std::strerror(err));
    }
    ++applied;
  }
  if (applied == 0) return ExecutorResponse::failure(ErrorKind::TargetNotFound, "pid " + std::to_string(pid) + " exited");
  return ExecutorResponse::success();
}

} // namespace lasso::app
