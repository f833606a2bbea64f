#include "common/assertions.hpp"
#include "common/detector_fixtures.hpp"
#include "detector/coresidency_detector.hpp"

#include <iostream>
#include <string>

namespace common = coresidency::tests::common;
namespace detector = coresidency::detector;
namespace metrics = coresidency::metrics;
using coresidency::core::errors::DetectorError;
using coresidency::core::logging::LogLevel;
using coresidency::core::logging::Logger;
using coresidency::events::EventBus;

namespace {

void Feed(detector::CoResidencyDetector& detector, const detector::SampleBatch& batch, int round) {
  DetectorError error;
  if (!detector.OnSampleBatch(batch, error)) {
    common::Fail("round " + std::to_string(round) + " rejected: " +
                 coresidency::core::errors::FormatDetectorError(error));
  }
}

bool Included(const detector::CoResidencyDetector& detector, const detector::HostId& host) {
  const auto snapshot = detector.FindHost(host);
  return snapshot.has_value() && snapshot->included;
}

} // namespace

int main() {
  common::ConfigurationFixture fixture;
  fixture.thresholds = {{"CpuUsage", 1000.0}};
  fixture.samples_before_inclusion = coresidency::config::kRequireFullWindow;
  fixture.samples_before_exclusion = coresidency::config::kRequireFullWindow;
  fixture.max_samples = 5;

  Logger logger(LogLevel::kWarn);
  EventBus bus(&logger);
  detector::CoResidencyDetector detector(common::MakeConfiguration(fixture), bus, logger);

  // Host "a" reports from round 1, host "b" joins in round 3 and is idle once
  // in round 4, so its window only fills with activity in round 9.
  for (int round = 1; round <= 10; ++round) {
    detector::SampleBatch batch;
    batch["a"] = common::Sample(1.0, {{"CpuUsage", 10.0}});
    if (round >= 3) {
      batch["b"] = common::Sample(round == 4 ? 0.0 : 1.0, {{"CpuUsage", 30.0}});
    }
    Feed(detector, batch, round);

    const auto averages = detector.LastPopulationAverages();
    if (round <= 5) {
      if (!averages.empty()) {
        common::Fail("no host may be averaged before its window is full of activity (round " +
                     std::to_string(round) + ")");
      }
      if (Included(detector, "a") != (round == 5)) {
        common::Fail("host a must become included exactly when its fifth active sample lands");
      }
    } else if (round <= 9) {
      if (averages.at("CpuUsage") != metrics::MetricValue(10.0)) {
        common::Fail("only host a may contribute in round " + std::to_string(round));
      }
    } else if (averages.at("CpuUsage") != metrics::MetricValue(20.0)) {
      common::Fail("host b must contribute in the batch after its window filled");
    }

    if (round == 8 && Included(detector, "b")) {
      common::Fail("host b window still holds an idle sample in round 8");
    }
    if (round == 9 && !Included(detector, "b")) {
      common::Fail("host b must be included once its window is all active");
    }

    const auto window = detector.FindHost("a");
    if (!window.has_value() || window->window_size > 5U) {
      common::Fail("window exceeded MaxSamples");
    }
  }

  std::cout << "detector_inclusion_smoke: ok\n";
  return 0;
}
