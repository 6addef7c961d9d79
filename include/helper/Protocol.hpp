// Wire contract between the unprivileged service and lasso-helper
#pragma once
#include "model/Errors.hpp"
#include "model/Priority.hpp"
#include "model/Topology.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lasso::helper {

enum class Op { Park, Unpark, SetPriority };

// One privileged operation. Only the fields the op names are meaningful.
struct ExecutorRequest {
  Op op{Op::Park};
  model::CoreId core{-1};
  int32_t pid{0};
  int nice{0};
  model::IoPriority io{};

  static ExecutorRequest park(model::CoreId c) { ExecutorRequest r; r.op = Op::Park; r.core = c; return r; }
  static ExecutorRequest unpark(model::CoreId c) { ExecutorRequest r; r.op = Op::Unpark; r.core = c; return r; }
  static ExecutorRequest set_priority(int32_t pid, int nice, model::IoPriority io) {
    ExecutorRequest r; r.op = Op::SetPriority; r.pid = pid; r.nice = nice; r.io = io; return r;
  }
};

struct ExecutorResponse {
  model::ErrorKind error{model::ErrorKind::None};
  std::string detail;

  [[nodiscard]] bool ok() const { return error == model::ErrorKind::None; }
  static ExecutorResponse success() { return {}; }
  static ExecutorResponse failure(model::ErrorKind e, std::string d) { return {e, std::move(d)}; }
};

inline constexpr model::CoreId kMaxCoreId = 8191;

// Exit codes of lasso-helper
inline constexpr int kExitOk = 0;
inline constexpr int kExitInvalidRequest = 2;
inline constexpr int kExitPermissionDenied = 3;
inline constexpr int kExitTargetNotFound = 4;
inline constexpr int kExitWriteFailed = 5;

[[nodiscard]] const char* to_string(Op op);

// argv tail (without the program name): {park N}, {unpark N},
// {setpriority PID NICE IOCLASS}
[[nodiscard]] std::vector<std::string> encode(const ExecutorRequest& req);

// Strict inverse of encode. Anything out of shape or range yields nullopt
// with a one-line reason in err.
[[nodiscard]] std::optional<ExecutorRequest> decode(const std::vector<std::string>& args, std::string& err);

[[nodiscard]] int exit_code_for(model::ErrorKind e);
[[nodiscard]] model::ErrorKind error_for_exit_code(int code);

} // namespace lasso::helper
