#pragma once
#include "model/Errors.hpp"
#include "model/Topology.hpp"
#include <string>

namespace lasso::model {

enum class ParkPhase { Unparked, Parking, Parked, Unparking, Failed };

struct ParkState {
  ParkPhase phase{ParkPhase::Unparked};
  ErrorKind error{ErrorKind::None};  // set only in Failed
  std::string reason;                // set only in Failed
  CoreSet parked;                    // cores this controller currently holds offline

  [[nodiscard]] bool settled() const {
    return phase != ParkPhase::Parking && phase != ParkPhase::Unparking;
  }
};

enum class ParkOutcome {
  Done,            // transition ran to its target
  AlreadyInState,  // idempotent no-op
  InProgress,      // another transition is in flight; state is a snapshot
  Cancelled,       // enable() unwound because disable() arrived
  Unsupported,     // topology has no asymmetry
  Failed           // executor failure; rollback attempted
};

struct ParkResult {
  ParkOutcome outcome{ParkOutcome::Done};
  ParkState state;
};

[[nodiscard]] const char* to_string(ParkPhase p);
[[nodiscard]] const char* to_string(ParkOutcome o);

} // namespace lasso::model
