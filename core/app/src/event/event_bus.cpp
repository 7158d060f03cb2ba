#include "twsgate/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace twsgate {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.push_back(std::make_shared<Subscriber>(id, std::move(callback)));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(
      subscribers_.begin(), subscribers_.end(),
      [id](const std::shared_ptr<Subscriber>& s) { return s->id == id; });
  if (it == subscribers_.end()) {
    return;
  }
  // Publishers holding an older copy of the list check this flag.
  (*it)->active.store(false);
  subscribers_.erase(it);
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  published_.fetch_add(1, std::memory_order_relaxed);

  std::vector<std::shared_ptr<Subscriber>> targets;
  {
    std::lock_guard lock(mutex_);
    targets = subscribers_;
  }

  for (const auto& subscriber : targets) {
    if (!subscriber->active.load()) {
      continue;
    }
    try {
      subscriber->callback(event);
    } catch (const std::exception& e) {
      failures_.fetch_add(1, std::memory_order_relaxed);
      std::cerr << "[EventBus] WARNING: subscriber " << subscriber->id
                << " threw on " << eventName(event) << ": " << e.what()
                << "\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace twsgate
