#include "metrics/sample_window.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace coresidency::metrics {

namespace {

MetricValue ValueOr(const MetricMap& sample, std::string_view metric) {
  const auto it = sample.find(std::string(metric));
  if (it == sample.end()) {
    return MetricValue{};
  }
  return it->second;
}

} // namespace

SampleWindow::SampleWindow(const std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1U)) {}

void SampleWindow::Push(MetricMap sample) {
  while (samples_.size() >= capacity_) {
    samples_.pop_front();
  }
  samples_.push_back(std::move(sample));
}

std::size_t SampleWindow::SetCapacity(const std::size_t capacity) {
  capacity_ = std::max<std::size_t>(capacity, 1U);
  std::size_t evicted = 0;
  while (samples_.size() > capacity_) {
    samples_.pop_front();
    ++evicted;
  }
  return evicted;
}

MetricValue SampleWindow::Latest(std::string_view metric) const {
  if (samples_.empty()) {
    return MetricValue{};
  }
  return ValueOr(samples_.back(), metric);
}

MetricValue SampleWindow::Average(std::string_view metric) const {
  MetricValue sum;
  for (const auto& sample : samples_) {
    sum += ValueOr(sample, metric);
  }
  return MeanOf(sum, samples_.size());
}

std::size_t SampleWindow::ActiveCount() const {
  return static_cast<std::size_t>(
      std::count_if(samples_.begin(), samples_.end(), [](const MetricMap& sample) {
        return ValueOr(sample, kActivityMetric) != MetricValue{};
      }));
}

} // namespace coresidency::metrics
