#pragma once

namespace lasso::model {

// Failure taxonomy shared by the executor protocol and every controller.
enum class ErrorKind {
  None,
  InvalidRequest,    // caller bug: rejected, never retried
  PermissionDenied,  // elevation not configured
  TargetNotFound,    // core or pid vanished
  WriteFailed,       // kernel refused the write (or executor timed out)
  Unsupported        // no exploitable topology asymmetry
};

[[nodiscard]] const char* to_string(ErrorKind e);

// User-facing remediation text; empty when there is nothing to suggest.
[[nodiscard]] const char* remediation_hint(ErrorKind e);

} // namespace lasso::model
