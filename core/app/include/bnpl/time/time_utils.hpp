#pragma once

#include <chrono>
#include <cstdint>

namespace bnpl {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time point carried by mirrored events. Ledger state itself keeps
// int64_t epoch milliseconds (the ITimeProvider unit); these helpers convert at
// the event boundary.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace bnpl
