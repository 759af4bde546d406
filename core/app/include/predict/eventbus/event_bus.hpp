#pragma once

#include "predict/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// EventBus — synchronous publish/subscribe for telemetry events
// -----------------------------------------------------------------------------
//
// @brief  Delivers each published Event to every subscriber on the
//         publishing thread.
//
// @details
// Subscribers register either for every Event or for one concrete type via
// subscribe<T>(), which filters with std::get_if. publish() copies the
// subscriber list under the mutex and invokes the callbacks after releasing
// it, so a callback may subscribe, unsubscribe or publish without
// deadlocking.
//
// Trades settle on several worker threads at once, so callbacks must be
// thread-safe. The trade server's bridge only pushes into a
// ThreadSafeQueue.
//
// Ownership:
//   Owned by TradingEngine. Subscribers must unsubscribe (or outlive the
//   bus) before they are destroyed.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only for events holding EventType.
  // Thread-safety: Safe from any thread; takes the subscriber mutex.
  // Input: callback — receives the concrete event, e.g. TradeSettledEvent.
  // Output: SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Invokes every current subscriber with the event, in subscription
  // order, on the calling thread.
  // Thread-safety: Safe from any thread. The list is copied under the lock
  // and callbacks run without it. A subscriber removed mid-publish may still
  // see this event.
  // Output: Number of subscribers the event was offered to.
  // Throws: Whatever a callback throws; later subscribers are then skipped.
  // -------------------------------------------------------------------------
  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;        // Guards subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(
      GenericCallback([cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace predict
