#pragma once
#include "app/Executor.hpp"
#include "collectors/ICoreProbe.hpp"
#include "model/Park.hpp"
#include "model/Topology.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lasso::app {

// Gaming Mode state machine. Takes the non-preferred cores offline through the
// executor and brings them back, with at most one transition in flight.
//
//   Unparked --enable--> Parking --ok--> Parked --disable--> Unparking --> Unparked
//                           |                                      |
//                           +--error (rolled back)--> Failed <-----+ (cores left offline)
//
// enable() and disable() run the transition on the calling thread; concurrent
// callers get InProgress with a snapshot. disable() during Parking is recorded
// and honoured before the next write; it returns once any park write already
// handed to the executor has finished, so no park starts after it returns.
class ParkingController {
public:
  using Listener = std::function<void(const model::ParkState&)>;

  ParkingController(IExecutor& executor, collectors::ICoreProbe& probe);

  model::ParkResult enable(const model::Topology& topo);
  model::ParkResult disable();

  [[nodiscard]] model::ParkState current_state() const;

  // Block until no transition is running. False on timeout.
  bool wait_settled(std::chrono::milliseconds timeout) const;

  // Called after every state change, outside the internal lock.
  void subscribe(Listener l);

private:
  void publish(const model::ParkState& s);
  // Bring cores back online newest-first; returns the ones that stayed offline
  model::CoreSet unpark_cores(const std::vector<model::CoreId>& cores, ExecutorResponse& last_error);
  model::ParkResult finish_unpark(std::unique_lock<std::mutex>& lk, const model::CoreSet& still_offline,
                                  const ExecutorResponse& last_error, model::ParkOutcome on_success);

  IExecutor& executor_;
  collectors::ICoreProbe& probe_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  model::ParkState state_{};
  bool cancel_requested_{false};
  bool park_in_flight_{false};
  std::thread::id parking_thread_{};

  std::mutex listeners_mu_;
  std::vector<Listener> listeners_;
};

} // namespace lasso::app
