#include "bnpl/time/simulation_time_provider.hpp"

namespace bnpl {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_ms)
    : current_time_ms_(start_ms) {}

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): atomic write to the simulated clock
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  // Monotonicity is not enforced; tests rely on setting arbitrary times.
  current_time_ms_.store(new_time_ms);
}

// -----------------------------------------------------------------------------
// advance_by(): relative move, single atomic read-modify-write
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  current_time_ms_.fetch_add(delta_ms);
}

}  // namespace bnpl
