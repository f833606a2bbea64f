#pragma once

#include "config/configuration.hpp"
#include "core/logging/logger.hpp"
#include "detector/sample_batch.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coresidency::events {

// Payloads carried on the bus:
// - SampleBatch for the sample event
// - HostId for mitigation start/stop
// - ConfigurationPtr for configuration reloads
using EventPayload = std::variant<detector::SampleBatch, detector::HostId, config::ConfigurationPtr>;

using EventHandler = std::function<void(const EventPayload&)>;

using SubscriptionToken = std::uint64_t;

// In-process publish/subscribe bus keyed by wire name.
//
// Contract:
// - Emit() is synchronous: every handler registered under the name runs on
//   the caller's thread, in registration order, before Emit() returns.
// - Handlers run outside the registry lock, so a handler may subscribe,
//   unsubscribe or emit. A handler removed while an Emit() is in flight may
//   still receive that one event.
// - Nothing is queued or coalesced: one Emit() is one delivery per handler.
class EventBus {
public:
  explicit EventBus(core::logging::Logger* logger = nullptr) : logger_(logger) {}

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionToken Subscribe(std::string name, EventHandler handler);

  // Returns false when the token is unknown (already removed).
  bool Unsubscribe(SubscriptionToken token);

  // Returns how many handlers received the event.
  std::size_t Emit(std::string_view name, const EventPayload& payload) const;

  std::size_t HandlerCount(std::string_view name) const;

private:
  struct Subscription {
    SubscriptionToken token = 0;
    std::string name;
    EventHandler handler;
  };

  core::logging::Logger* logger_ = nullptr;
  mutable std::mutex mu_;
  std::vector<Subscription> subscriptions_;
  SubscriptionToken next_token_ = 1;
};

} // namespace coresidency::events
