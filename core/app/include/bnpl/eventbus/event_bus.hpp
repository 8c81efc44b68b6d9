#pragma once

#include "bnpl/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace bnpl {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for mirrored protocol events.
// EventMirror is the only publisher inside the core; subscribers are external
// observers (the node's telemetry bridge, loggers, tests).
//
// Subscribers never feed back into ledger state. A subscriber that wants to
// act on an event (e.g. an indexer) does so outside the operation that
// produced it.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe, and
// publish from any thread. Callbacks run synchronously on the thread that
// calls publish().
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Callback type for "all events": receives the Event variant.
  using GenericCallback = std::function<void(const Event&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published event.
  // Thread-safety: Safe to call from any thread.
  // Output: SubscriptionId to use with unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the published event holds a
  // value of type EventType (e.g. DefaultEvent).
  // Thread-safety: Same as subscribe(GenericCallback).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // What: Removes the subscription with the given id. Unknown ids are
  // ignored. A publish() already in progress may still deliver to it.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Delivers the event to every registered subscriber before returning.
  // Thread-safety: The subscriber list is copied under the lock and callbacks
  // run without it, so a callback may publish or unsubscribe.
  // Exceptions: A throwing subscriber propagates to the caller. EventMirror
  // catches at its boundary; direct publishers must do the same.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace bnpl
