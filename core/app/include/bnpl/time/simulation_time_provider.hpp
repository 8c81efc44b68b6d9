#pragma once

#include "bnpl/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace bnpl {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         by the caller rather than read from the system clock.
//
// @details
// Default processing is entirely time-driven: a loan becomes eligible once
// now >= dueAt + gracePeriod. Tests and replay harnesses need to stand exactly
// on those boundaries (T - 1 ms, T, T + n days), which a wall clock cannot do.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_
//
// The node's IPC thread may read the clock while a harness advances it, so the
// value is atomic rather than mutex-protected.
//
// Monotonicity is the caller's responsibility; set_time() accepts any value
// so tests can construct arbitrary timelines.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at the given epoch time (0 = "no time has passed yet").
  explicit SimulationTimeProvider(std::int64_t start_ms = 0);

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given absolute timestamp.
  //
  // Thread-safety: Safe to call from any thread.
  // Side-effects:  Changes the value returned by now_ms() globally.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by a relative amount.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace bnpl
