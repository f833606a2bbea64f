#include "detector/host_state.hpp"

#include <limits>
#include <string>
#include <utility>

namespace coresidency::detector {

void SaturatingIncrement(int& counter) {
  if (counter < std::numeric_limits<int>::max()) {
    ++counter;
  }
}

void HostState::RecordSample(metrics::MetricMap sample) {
  const auto activity = sample.find(std::string(metrics::kActivityMetric));
  const bool active = activity != sample.end() && activity->second != metrics::MetricValue{};

  window.Push(std::move(sample));

  if (active) {
    SaturatingIncrement(consecutive_active);
    consecutive_inactive = 0;
  } else {
    SaturatingIncrement(consecutive_inactive);
    consecutive_active = 0;
  }
}

HostSnapshot MakeHostSnapshot(const HostState& state) {
  return HostSnapshot{
      .window_size = state.window.Size(),
      .window_capacity = state.window.Capacity(),
      .consecutive_active = state.consecutive_active,
      .consecutive_inactive = state.consecutive_inactive,
      .included = state.included,
      .flag_count = state.flag_count,
      .deflag_count = state.deflag_count,
      .mitigating = state.mitigating,
  };
}

} // namespace coresidency::detector
