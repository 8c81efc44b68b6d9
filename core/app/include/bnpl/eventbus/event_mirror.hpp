#pragma once

#include "bnpl/eventbus/event_bus.hpp"
#include "bnpl/events/event.hpp"
#include "bnpl/ledger/journal.hpp"
#include "bnpl/time/i_time_provider.hpp"

#include <cstdint>

namespace bnpl {

// -----------------------------------------------------------------------------
// EventMirror: fire-and-forget event sink used by the ledgers
// -----------------------------------------------------------------------------
//
// @brief  Stamps protocol events with the trusted clock, holds them until the
//         producing operation commits, then publishes them on the EventBus.
//
// @details
// Components call emit() in the middle of an operation, typically right after
// the mutation the event describes. If the operation later fails and the
// Journal rolls back, the event is discarded with it. Observers therefore only
// ever see events for state that actually exists.
//
// Fire-and-forget:
//   - emit() returns nothing and never throws on behalf of a subscriber.
//   - A subscriber exception is caught at publish time, logged to stderr, and
//     dropped. The ledgers have already committed and are unaffected.
//   - No retry.
//
// Sequence numbers are assigned at publish time, so they are gap-free across
// committed events only.
//
// Thread model:
//   Called on the serialized protocol thread. Publishing reaches subscribers
//   synchronously on that thread.
//
// Ownership:
//   Owned by ProtocolNode. Holds references to the EventBus, Journal and clock.
// -----------------------------------------------------------------------------
class EventMirror {
 public:
  EventMirror(EventBus& bus, Journal& journal, const ITimeProvider& clock);

  EventMirror(const EventMirror&) = delete;
  EventMirror& operator=(const EventMirror&) = delete;

  // -------------------------------------------------------------------------
  // emit(event)
  // -------------------------------------------------------------------------
  // @brief  Stamps event.timestamp from the clock and schedules publication
  //         for the commit of the enclosing Journal scope (immediately when no
  //         scope is open).
  // -------------------------------------------------------------------------
  void emit(Event event);

  std::uint64_t publishedCount() const { return next_sequence_ - 1; }

 private:
  void publish(Event event);

  EventBus& bus_;
  Journal& journal_;
  const ITimeProvider& clock_;
  std::uint64_t next_sequence_{1};
};

}  // namespace bnpl
