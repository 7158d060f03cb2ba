#include "twsgate/time/clock.hpp"
#include "twsgate/time/time_utils.hpp"

namespace twsgate {

domain::Timestamp LiveClock::now() const {
  return std::chrono::system_clock::now();
}

ManualClock::ManualClock(domain::Timestamp start)
    : now_ms_(timestamp_to_ms(start)) {}

domain::Timestamp ManualClock::now() const {
  return ms_to_timestamp(now_ms_.load());
}

void ManualClock::set(domain::Timestamp t) {
  now_ms_.store(timestamp_to_ms(t));
}

void ManualClock::advance(std::chrono::milliseconds delta) {
  now_ms_.fetch_add(delta.count());
}

}  // namespace twsgate
