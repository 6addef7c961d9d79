#include "helper/Apply.hpp"
#include "util/Ioprio.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <vector>

namespace lasso::helper {

using model::ErrorKind;

static ErrorKind classify_errno(int err) {
  switch (err) {
    case EACCES:
    case EPERM: return ErrorKind::PermissionDenied;
    case ENOENT:
    case ESRCH: return ErrorKind::TargetNotFound;
    default: return ErrorKind::WriteFailed;
  }
}

static ExecutorResponse write_online(const HelperPaths& paths, model::CoreId core, bool online) {
  std::string path = paths.cpu_dir + "/cpu" + std::to_string(core) + "/online";
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0)
    return ExecutorResponse::failure(ErrorKind::TargetNotFound, "cpu" + std::to_string(core) + " has no online control");
  int fd = ::open(path.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC);
  if (fd < 0) {
    int err = errno;
    return ExecutorResponse::failure(classify_errno(err), path + ": " + std::strerror(err));
  }
  const char* val = online ? "1" : "0";
  ssize_t n = ::write(fd, val, 1);
  int err = errno;
  ::close(fd);
  if (n != 1) {
    // EBUSY/EINVAL here usually means the kernel refused to offline the last core
    return ExecutorResponse::failure(n < 0 ? classify_errno(err) : ErrorKind::WriteFailed,
                                     path + ": " + (n < 0 ? std::strerror(err) : "short write"));
  }
  return ExecutorResponse::success();
}

static std::vector<int> list_tasks(const std::string& task_dir) {
  std::vector<int> tids;
  DIR* d = ::opendir(task_dir.c_str());
  if (!d) return tids;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    int tid = 0;
    auto end = name + std::strlen(name);
    auto [ptr, ec] = std::from_chars(name, end, tid);
    if (ec == std::errc{} && ptr == end && tid > 0) tids.push_back(tid);
  }
  ::closedir(d);
  return tids;
}

static ExecutorResponse set_priority(const HelperPaths& paths, const ExecutorRequest& req) {
  // Games spawn many threads, each with its own nice value; apply to all of them
  auto tids = list_tasks(paths.proc_dir + "/" + std::to_string(req.pid) + "/task");
  if (tids.empty())
    return ExecutorResponse::failure(ErrorKind::TargetNotFound, "pid " + std::to_string(req.pid) + " not found");

  size_t applied = 0;
  for (int tid : tids) {
    if (::setpriority(PRIO_PROCESS, static_cast<id_t>(tid), req.nice) != 0) {
      int err = errno;
      if (err == ESRCH) continue;  // thread exited mid-walk
      return ExecutorResponse::failure(classify_errno(err), "setpriority tid " + std::to_string(tid) + ": " + std::strerror(err));
    }
    if (util::ioprio_set_thread(tid, req.io) != 0) {
      int err = errno;
      if (err == ESRCH) continue;
      return ExecutorResponse::failure(classify_errno(err), "ioprio_set tid " + std::to_string(tid) + ": " + std::strerror(err));
    }
    ++applied;
  }
  if (applied == 0)
    return ExecutorResponse::failure(ErrorKind::TargetNotFound, "pid " + std::to_string(req.pid) + " exited");
  return ExecutorResponse::success();
}

ExecutorResponse execute_request(const ExecutorRequest& req, const HelperPaths& paths) {
  switch (req.op) {
    case Op::Park:
    case Op::Unpark:
      if (req.core < 0 || req.core > kMaxCoreId)
        return ExecutorResponse::failure(ErrorKind::InvalidRequest, "core id out of range");
      return write_online(paths, req.core, req.op == Op::Unpark);
    case Op::SetPriority:
      if (req.pid <= 0 || req.nice < model::kNiceMin || req.nice > model::kNiceMax)
        return ExecutorResponse::failure(ErrorKind::InvalidRequest, "priority request out of range");
      return set_priority(paths, req);
  }
  return ExecutorResponse::failure(ErrorKind::InvalidRequest, "unknown operation");
}

} // namespace lasso::helper
