#include "model/Errors.hpp"
#include "model/Park.hpp"
#include "model/Priority.hpp"
#include "model/Rules.hpp"
#include "model/Topology.hpp"

#include <charconv>

namespace lasso::model {

const char* to_string(ErrorKind e) {
  switch (e) {
    case ErrorKind::None:             return "ok";
    case ErrorKind::InvalidRequest:   return "invalid-request";
    case ErrorKind::PermissionDenied: return "permission-denied";
    case ErrorKind::TargetNotFound:   return "target-not-found";
    case ErrorKind::WriteFailed:      return "write-failed";
    case ErrorKind::Unsupported:      return "unsupported";
  }
  return "unknown";
}

const char* remediation_hint(ErrorKind e) {
  switch (e) {
    case ErrorKind::PermissionDenied:
      return "install lasso-helper root-owned (0755) and add a sudoers rule "
             "'<user> ALL=(root) NOPASSWD: <helper_path>'";
    case ErrorKind::Unsupported:
      return "this CPU has no cache or core-type asymmetry; Gaming Mode is unavailable";
    case ErrorKind::WriteFailed:
      return "the kernel refused the write; check dmesg and the core's online file";
    default:
      return "";
  }
}

const char* to_string(ClassificationReason r) {
  switch (r) {
    case ClassificationReason::CacheAsymmetricCCD: return "cache-asymmetric-ccd";
    case ClassificationReason::HybridPCoreECore:   return "hybrid-pcore-ecore";
    case ClassificationReason::Uniform:            return "uniform";
  }
  return "uniform";
}

const char* to_string(ParkPhase p) {
  switch (p) {
    case ParkPhase::Unparked:  return "unparked";
    case ParkPhase::Parking:   return "parking";
    case ParkPhase::Parked:    return "parked";
    case ParkPhase::Unparking: return "unparking";
    case ParkPhase::Failed:    return "failed";
  }
  return "unparked";
}

const char* to_string(ParkOutcome o) {
  switch (o) {
    case ParkOutcome::Done:           return "done";
    case ParkOutcome::AlreadyInState: return "already-in-state";
    case ParkOutcome::InProgress:     return "in-progress";
    case ParkOutcome::Cancelled:      return "cancelled";
    case ParkOutcome::Unsupported:    return "unsupported";
    case ParkOutcome::Failed:         return "failed";
  }
  return "done";
}

std::string to_string(const IoPriority& p) {
  switch (p.io_class) {
    case IoClass::None:       return "none";
    case IoClass::RealTime:   return "rt:" + std::to_string(p.level);
    case IoClass::BestEffort: return "be:" + std::to_string(p.level);
    case IoClass::Idle:       return "idle";
  }
  return "none";
}

std::optional<IoPriority> parse_io_priority(const std::string& s) {
  if (s == "none") return IoPriority{IoClass::None, 0};
  if (s == "idle") return IoPriority{IoClass::Idle, 0};
  auto colon = s.find(':');
  if (colon == std::string::npos) return std::nullopt;
  auto cls = s.substr(0, colon);
  IoPriority out{};
  if (cls == "rt") out.io_class = IoClass::RealTime;
  else if (cls == "be") out.io_class = IoClass::BestEffort;
  else return std::nullopt;
  const char* b = s.data() + colon + 1;
  const char* e = s.data() + s.size();
  if (b == e || *b < '0' || *b > '9') return std::nullopt;
  auto [ptr, ec] = std::from_chars(b, e, out.level);
  if (ec != std::errc{} || ptr != e) return std::nullopt;
  if (out.level < 0 || out.level > 7) return std::nullopt;
  return out;
}

const char* to_string(MatchMode m) {
  switch (m) {
    case MatchMode::Exact:    return "exact";
    case MatchMode::Contains: return "contains";
    case MatchMode::Regex:    return "regex";
  }
  return "contains";
}

std::optional<MatchMode> parse_match_mode(const std::string& s) {
  if (s == "exact") return MatchMode::Exact;
  if (s == "contains") return MatchMode::Contains;
  if (s == "regex") return MatchMode::Regex;
  return std::nullopt;
}

const char* to_string(CoreScope s) {
  switch (s) {
    case CoreScope::Explicit:     return "explicit";
    case CoreScope::Preferred:    return "preferred";
    case CoreScope::NonPreferred: return "nonpreferred";
  }
  return "explicit";
}

std::optional<CoreScope> parse_core_scope(const std::string& s) {
  if (s == "explicit") return CoreScope::Explicit;
  if (s == "preferred") return CoreScope::Preferred;
  if (s == "nonpreferred" || s == "non-preferred") return CoreScope::NonPreferred;
  return std::nullopt;
}

} // namespace lasso::model
