#include "util/Ioprio.hpp"

#include <sys/syscall.h>
#include <unistd.h>

namespace lasso::util {

static constexpr int kClassShift = 13;
static constexpr int kLevelMask = (1 << kClassShift) - 1;
static constexpr int kWhoProcess = 1;  // IOPRIO_WHO_PROCESS

int ioprio_encode(const model::IoPriority& p) {
  int cls = static_cast<int>(p.io_class);
  int level = (p.io_class == model::IoClass::RealTime || p.io_class == model::IoClass::BestEffort) ? p.level : 0;
  return (cls << kClassShift) | (level & kLevelMask);
}

model::IoPriority ioprio_decode(int value) {
  model::IoPriority p;
  int cls = value >> kClassShift;
  if (cls < 0 || cls > 3) cls = 0;
  p.io_class = static_cast<model::IoClass>(cls);
  if (p.io_class == model::IoClass::RealTime || p.io_class == model::IoClass::BestEffort)
    p.level = value & kLevelMask;
  return p;
}

int ioprio_set_thread(int tid, const model::IoPriority& p) {
  return static_cast<int>(::syscall(SYS_ioprio_set, kWhoProcess, tid, ioprio_encode(p)));
}

int ioprio_get_thread(int tid, model::IoPriority& out) {
  long rc = ::syscall(SYS_ioprio_get, kWhoProcess, tid);
  if (rc < 0) return -1;
  out = ioprio_decode(static_cast<int>(rc));
  return 0;
}

} // namespace lasso::util
