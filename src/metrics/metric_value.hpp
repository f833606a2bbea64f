#pragma once

#include <cmath>
#include <compare>
#include <concepts>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace coresidency::metrics {

// Reserved metric carrying the caller-computed 0/1 activity bit. It gates
// inclusion/exclusion and never takes part in threshold comparison.
inline constexpr std::string_view kActivityMetric = "Activity";

// Capability set every metric value type must provide so population
// statistics can be computed generically:
// - `a + b` accumulates contributions
// - `a / n` divides by a sample or host count (n == 0 yields the neutral value)
// - `a < b` orders values for threshold comparison
// - `AbsoluteDifference(a, b)` expresses deviation
// - `T{}` is the neutral element standing in for "no activity on this metric"
template <typename T>
concept MetricLike = std::default_initializable<T> && requires(const T a, const T b, std::size_t n) {
  { a + b } -> std::convertible_to<T>;
  { a / n } -> std::convertible_to<T>;
  { a < b } -> std::convertible_to<bool>;
  { AbsoluteDifference(a, b) } -> std::convertible_to<T>;
};

// Floating-point backed metric value. Default-constructed value is 0.0, the
// neutral element.
class MetricValue {
public:
  constexpr MetricValue() = default;
  constexpr explicit MetricValue(double value) : value_(value) {}

  constexpr double AsDouble() const {
    return value_;
  }

  bool IsFinite() const {
    return std::isfinite(value_);
  }

  constexpr MetricValue operator+(const MetricValue& other) const {
    return MetricValue(value_ + other.value_);
  }

  constexpr MetricValue operator-(const MetricValue& other) const {
    return MetricValue(value_ - other.value_);
  }

  constexpr MetricValue& operator+=(const MetricValue& other) {
    value_ += other.value_;
    return *this;
  }

  constexpr MetricValue operator/(std::size_t count) const {
    if (count == 0U) {
      return MetricValue{};
    }
    return MetricValue(value_ / static_cast<double>(count));
  }

  constexpr auto operator<=>(const MetricValue& other) const = default;

private:
  double value_ = 0.0;
};

inline MetricValue AbsoluteDifference(const MetricValue& a, const MetricValue& b) {
  return MetricValue(std::fabs(a.AsDouble() - b.AsDouble()));
}

static_assert(MetricLike<MetricValue>);

// One host's observation for one round: metric name -> value.
using MetricMap = std::map<std::string, MetricValue>;

// Mean of `count` contributions already folded into `sum`.
template <MetricLike T>
T MeanOf(const T& sum, std::size_t count) {
  return sum / count;
}

} // namespace coresidency::metrics
