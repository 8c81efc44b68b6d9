#pragma once

#include <cstdint>

namespace bnpl {

// -----------------------------------------------------------------------------
// ITimeProvider: the protocol's trusted clock
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Every time-dependent rule in the protocol reads this one clock:
//   - LoanOrchestrator stamps createdAt and computes dueAt.
//   - DefaultDetector compares now against dueAt + grace period and derives
//     daysOverdue.
//   - EventMirror stamps mirrored events.
//
// All components share the same instance, so "overdue" means the same thing
// everywhere. Implementations:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the test or harness.
//
// Why int64_t milliseconds instead of std::chrono::time_point:
//   - Command payloads and telemetry carry integer timestamps; int64_t needs
//     no conversion at the JSON boundary.
//   - Day arithmetic (kMsPerDay) stays plain integer division.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. Writers must
//   synchronize with readers internally.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace bnpl
