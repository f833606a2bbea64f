#pragma once

#include "metrics/sample_window.hpp"

#include <cstddef>

namespace coresidency::detector {

// Per-host decision record. Created on first observation and kept for the
// lifetime of the detector.
struct HostState {
  explicit HostState(std::size_t max_samples) : window(max_samples) {}

  metrics::SampleWindow window;

  // Run lengths of the Activity bit, saturating at INT_MAX.
  int consecutive_active = 0;
  int consecutive_inactive = 0;

  // Whether the host takes part in the population average and the threshold
  // comparison.
  bool included = false;

  int flag_count = 0;
  int deflag_count = 0;

  bool mitigating = false;

  // Appends `sample` to the window and advances the activity run lengths.
  void RecordSample(metrics::MetricMap sample);
};

// Read-only view of a host handed out to observers.
struct HostSnapshot {
  std::size_t window_size = 0;
  std::size_t window_capacity = 0;
  int consecutive_active = 0;
  int consecutive_inactive = 0;
  bool included = false;
  int flag_count = 0;
  int deflag_count = 0;
  bool mitigating = false;
};

HostSnapshot MakeHostSnapshot(const HostState& state);

// ++counter, stopping at INT_MAX.
void SaturatingIncrement(int& counter);

} // namespace coresidency::detector
