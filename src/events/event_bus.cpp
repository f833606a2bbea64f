#include "events/event_bus.hpp"

#include <algorithm>
#include <utility>

namespace coresidency::events {

SubscriptionToken EventBus::Subscribe(std::string name, EventHandler handler) {
  SubscriptionToken token = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    token = next_token_++;
    subscriptions_.push_back(Subscription{
        .token = token,
        .name = name,
        .handler = std::move(handler),
    });
  }

  if (logger_ != nullptr) {
    logger_->Debug("event subscription registered",
                   {{"event", name}, {"token", std::to_string(token)}});
  }
  return token;
}

bool EventBus::Unsubscribe(const SubscriptionToken token) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                               [token](const Subscription& sub) { return sub.token == token; });
  if (it == subscriptions_.end()) {
    return false;
  }
  subscriptions_.erase(it);
  return true;
}

std::size_t EventBus::Emit(std::string_view name, const EventPayload& payload) const {
  std::vector<EventHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& sub : subscriptions_) {
      if (sub.name == name) {
        handlers.push_back(sub.handler);
      }
    }
  }

  if (logger_ != nullptr) {
    logger_->Debug("emitting event",
                   {{"event", name}, {"handlers", std::to_string(handlers.size())}});
  }

  for (const auto& handler : handlers) {
    handler(payload);
  }
  return handlers.size();
}

std::size_t EventBus::HandlerCount(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mu_);
  return static_cast<std::size_t>(std::count_if(
      subscriptions_.begin(), subscriptions_.end(),
      [name](const Subscription& sub) { return sub.name == name; }));
}

} // namespace coresidency::events
