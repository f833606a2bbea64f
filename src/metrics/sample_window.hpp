#pragma once

#include "metrics/metric_value.hpp"

#include <cstddef>
#include <deque>
#include <string_view>

namespace coresidency::metrics {

// Bounded, ordered history of one host's metric maps.
//
// Contract:
// - Size() <= Capacity() after every mutation; pushing into a full window
//   evicts the oldest sample first.
// - Capacity() is always >= 1 (a requested capacity of 0 is clamped).
// - SetCapacity() shrinking the window drops the oldest samples.
class SampleWindow {
public:
  explicit SampleWindow(std::size_t capacity);

  void Push(MetricMap sample);

  // Returns how many samples were evicted to honor the new capacity.
  std::size_t SetCapacity(std::size_t capacity);

  std::size_t Size() const {
    return samples_.size();
  }

  std::size_t Capacity() const {
    return capacity_;
  }

  bool Empty() const {
    return samples_.empty();
  }

  bool Full() const {
    return samples_.size() == capacity_;
  }

  // Latest value of `metric`; neutral when absent or the window is empty.
  MetricValue Latest(std::string_view metric) const;

  // Sum of `metric` over the retained samples divided by Size().
  // Samples that lack the metric contribute the neutral element.
  MetricValue Average(std::string_view metric) const;

  // Number of retained samples whose Activity metric is non-zero.
  std::size_t ActiveCount() const;

  const std::deque<MetricMap>& Samples() const {
    return samples_;
  }

private:
  std::size_t capacity_ = 1;
  std::deque<MetricMap> samples_;
};

} // namespace coresidency::metrics
