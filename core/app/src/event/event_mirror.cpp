#include "bnpl/eventbus/event_mirror.hpp"
#include "bnpl/time/time_utils.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace bnpl {

EventMirror::EventMirror(EventBus& bus, Journal& journal,
                         const ITimeProvider& clock)
    : bus_(bus), journal_(journal), clock_(clock) {}

// -----------------------------------------------------------------------------
// emit: stamp now, publish on commit
// -----------------------------------------------------------------------------
void EventMirror::emit(Event event) {
  const Timestamp ts = ms_to_timestamp(clock_.now_ms());
  std::visit([ts](auto& e) { e.timestamp = ts; }, event);

  journal_.onCommit(
      [this, e = std::move(event)]() mutable { publish(std::move(e)); });
}

// -----------------------------------------------------------------------------
// publish: assign the sequence id and hand off to subscribers
// -----------------------------------------------------------------------------
void EventMirror::publish(Event event) {
  const std::uint64_t seq = next_sequence_++;
  std::visit([seq](auto& e) { e.sequence_id = seq; }, event);

  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[EventMirror] WARNING: subscriber failed on event seq="
              << seq << ": " << e.what() << ". Dropped.\n";
  }
}

}  // namespace bnpl
