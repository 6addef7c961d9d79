#include "helper/Protocol.hpp"

#include <charconv>

namespace lasso::helper {

const char* to_string(Op op) {
  switch (op) {
    case Op::Park: return "park";
    case Op::Unpark: return "unpark";
    case Op::SetPriority: return "setpriority";
  }
  return "?";
}

std::vector<std::string> encode(const ExecutorRequest& req) {
  switch (req.op) {
    case Op::Park:
    case Op::Unpark:
      return {to_string(req.op), std::to_string(req.core)};
    case Op::SetPriority:
      return {to_string(req.op), std::to_string(req.pid), std::to_string(req.nice), model::to_string(req.io)};
  }
  return {};
}

// Decimal digits only, optional leading '-' when allow_negative
static std::optional<long long> parse_number(const std::string& s, bool allow_negative) {
  if (s.empty() || s.size() > 12) return std::nullopt;
  size_t i = 0;
  if (s[0] == '-') {
    if (!allow_negative || s.size() == 1) return std::nullopt;
    i = 1;
  }
  for (size_t k = i; k < s.size(); ++k)
    if (s[k] < '0' || s[k] > '9') return std::nullopt;
  long long v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

std::optional<ExecutorRequest> decode(const std::vector<std::string>& args, std::string& err) {
  if (args.empty()) { err = "missing operation"; return std::nullopt; }
  const std::string& op = args[0];
  if (op == "park" || op == "unpark") {
    if (args.size() != 2) { err = op + " takes exactly one core id"; return std::nullopt; }
    auto core = parse_number(args[1], false);
    if (!core || *core > kMaxCoreId) { err = "bad core id: " + args[1]; return std::nullopt; }
    return op == "park" ? ExecutorRequest::park(static_cast<int>(*core))
                        : ExecutorRequest::unpark(static_cast<int>(*core));
  }
  if (op == "setpriority") {
    if (args.size() != 4) { err = "setpriority takes PID NICE IOCLASS"; return std::nullopt; }
    auto pid = parse_number(args[1], false);
    if (!pid || *pid <= 0 || *pid > 0x3fffffff) { err = "bad pid: " + args[1]; return std::nullopt; }
    auto nice = parse_number(args[2], true);
    if (!nice || *nice < model::kNiceMin || *nice > model::kNiceMax) { err = "nice out of range: " + args[2]; return std::nullopt; }
    auto io = model::parse_io_priority(args[3]);
    if (!io) { err = "bad io class: " + args[3]; return std::nullopt; }
    return ExecutorRequest::set_priority(static_cast<int32_t>(*pid), static_cast<int>(*nice), *io);
  }
  err = "unknown operation: " + op;
  return std::nullopt;
}

int exit_code_for(model::ErrorKind e) {
  using model::ErrorKind;
  switch (e) {
    case ErrorKind::None: return kExitOk;
    case ErrorKind::InvalidRequest: return kExitInvalidRequest;
    case ErrorKind::PermissionDenied: return kExitPermissionDenied;
    case ErrorKind::TargetNotFound: return kExitTargetNotFound;
    case ErrorKind::WriteFailed:
    case ErrorKind::Unsupported: return kExitWriteFailed;
  }
  return kExitWriteFailed;
}

model::ErrorKind error_for_exit_code(int code) {
  using model::ErrorKind;
  switch (code) {
    case kExitOk: return ErrorKind::None;
    case kExitInvalidRequest: return ErrorKind::InvalidRequest;
    case kExitPermissionDenied: return ErrorKind::PermissionDenied;
    case kExitTargetNotFound: return ErrorKind::TargetNotFound;
    default: return ErrorKind::WriteFailed;
  }
}

} // namespace lasso::helper
