// Thin wrappers over the ioprio_get/ioprio_set syscalls (no glibc wrapper)
#pragma once
#include "model/Priority.hpp"

namespace lasso::util {

// Kernel ioprio value: class << 13 | level
[[nodiscard]] int ioprio_encode(const model::IoPriority& p);
[[nodiscard]] model::IoPriority ioprio_decode(int value);

// Per-thread. Return -1 and set errno on failure.
int ioprio_set_thread(int tid, const model::IoPriority& p);
int ioprio_get_thread(int tid, model::IoPriority& out);

} // namespace lasso::util
