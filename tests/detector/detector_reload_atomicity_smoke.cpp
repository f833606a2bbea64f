#include "common/assertions.hpp"
#include "common/detector_fixtures.hpp"
#include "detector/coresidency_detector.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace common = coresidency::tests::common;
namespace detector = coresidency::detector;
using coresidency::core::errors::DetectorError;
using coresidency::core::logging::LogLevel;
using coresidency::core::logging::Logger;
using coresidency::events::EventBus;
using coresidency::events::EventPayload;

namespace {

constexpr int kReloads = 200;

common::ConfigurationFixture Family(const std::string& suffix, int max_samples) {
  common::ConfigurationFixture fixture;
  fixture.version = suffix;
  fixture.thresholds = {{"CpuUsage", 10.0}};
  fixture.flags_before_activation = 1;
  fixture.deflags_before_deactivation = 1;
  fixture.max_samples = max_samples;
  fixture.event_names = {{"StartMitigation", "Start" + suffix}, {"StopMitigation", "Stop" + suffix}};
  return fixture;
}

// Odd rounds split the population in two (everyone is over threshold), even
// rounds are flat (everyone deflags). Every round after the first therefore
// produces one transition per host.
detector::SampleBatch Round(int round) {
  const bool split = round % 2 == 1;
  return {
      {"h1", common::Sample(1.0, {{"CpuUsage", split ? 100.0 : 50.0}})},
      {"h2", common::Sample(1.0, {{"CpuUsage", split ? 100.0 : 50.0}})},
      {"h3", common::Sample(1.0, {{"CpuUsage", split ? 0.0 : 50.0}})},
      {"h4", common::Sample(1.0, {{"CpuUsage", split ? 0.0 : 50.0}})},
  };
}

// A batch waiting behind another one runs on the configuration installed while
// it waited. Batch 1's StartX handler queues batch 2 on a second thread, gives
// it time to block, and only then reloads to family Y.
void RunReloadWhileQueuedScenario() {
  const auto family_x = common::MakeConfiguration(Family("X", 5));
  const auto family_y = common::MakeConfiguration(Family("Y", 5));

  Logger logger(LogLevel::kError);
  EventBus bus(&logger);
  detector::CoResidencyDetector detector(family_x, bus, logger);
  common::HostEventRecorder stops_x(bus, "StopX");
  common::HostEventRecorder stops_y(bus, "StopY");

  // h1 spikes alone: the average is 60, h1 deviates by 40, everyone else by 10.
  const detector::SampleBatch calm = common::CpuBatch(
      {{"h1", 50.0}, {"h2", 50.0}, {"h3", 50.0}, {"h4", 50.0}, {"h5", 50.0}});
  const detector::SampleBatch spike = common::CpuBatch(
      {{"h1", 100.0}, {"h2", 50.0}, {"h3", 50.0}, {"h4", 50.0}, {"h5", 50.0}});

  std::thread queued;
  std::atomic<bool> queued_ok{false};
  bus.Subscribe("StartX", [&](const EventPayload&) {
    queued = std::thread([&] {
      DetectorError error;
      queued_ok.store(detector.OnSampleBatch(calm, error));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    if (!detector.OnConfigurationReloaded(family_y)) {
      common::Fail("reload refused a valid snapshot");
    }
  });

  DetectorError error;
  if (!detector.OnSampleBatch(calm, error) || !detector.OnSampleBatch(spike, error)) {
    common::Fail("batch rejected: " + coresidency::core::errors::FormatDetectorError(error));
  }
  if (!queued.joinable()) {
    common::Fail("spike must start mitigation for h1");
  }
  queued.join();

  if (!queued_ok.load()) {
    common::Fail("queued batch rejected");
  }
  if (stops_x.Count() != 0U || stops_y.Hosts() != std::vector<detector::HostId>{"h1"}) {
    common::Fail("queued batch must release h1 under the reloaded wire name");
  }
}

void RunConcurrentReloadScenario() {
  const auto family_x = common::MakeConfiguration(Family("X", 5));
  const auto family_y = common::MakeConfiguration(Family("Y", 3));

  Logger logger(LogLevel::kError);
  EventBus bus(&logger);
  detector::CoResidencyDetector detector(family_x, bus, logger);

  // Handlers run on the feeding thread, inside OnSampleBatch.
  std::vector<std::string> round_events;
  for (const char* name : {"StartX", "StopX", "StartY", "StopY"}) {
    const std::string wire(name);
    bus.Subscribe(wire, [&round_events, wire](const EventPayload&) { round_events.push_back(wire); });
  }

  std::atomic<bool> reloads_done{false};
  std::thread reloader([&] {
    for (int i = 0; i < kReloads; ++i) {
      if (!detector.OnConfigurationReloaded(i % 2 == 0 ? family_x : family_y)) {
        common::Fail("reload refused a valid snapshot");
      }
      std::this_thread::yield();
    }
    reloads_done.store(true);
  });

  bool saw_y = false;
  int extra_rounds = 0;
  for (int round = 0; extra_rounds < 10; ++round) {
    if (reloads_done.load()) {
      ++extra_rounds;
    }

    round_events.clear();
    DetectorError error;
    if (!detector.OnSampleBatch(Round(round), error)) {
      common::Fail("batch rejected: " + coresidency::core::errors::FormatDetectorError(error));
    }

    if (round == 0) {
      if (!round_events.empty()) {
        common::Fail("warm-up round must not emit");
      }
      continue;
    }
    if (round_events.size() != 4U) {
      common::Fail("expected one transition per host in round " + std::to_string(round));
    }
    const char family = round_events.front().back();
    for (const auto& event : round_events) {
      if (event.back() != family) {
        common::Fail("one batch emitted events from two configurations");
      }
    }
    saw_y = saw_y || family == 'Y';

    const auto host = detector.FindHost("h1");
    if (!host.has_value() || host->window_size > host->window_capacity ||
        (host->window_capacity != 5U && host->window_capacity != 3U)) {
      common::Fail("window capacity must follow the snapshot in force");
    }
  }
  reloader.join();

  if (!saw_y) {
    common::Fail("rounds after the last reload must use the reloaded configuration");
  }
  if (detector.CurrentConfiguration()->version != "Y") {
    common::Fail("last reload must be the active configuration");
  }
  if (detector.GetStats().configuration_reloads != static_cast<std::uint64_t>(kReloads)) {
    common::Fail("every reload must be counted");
  }
}

} // namespace

int main() {
  RunConcurrentReloadScenario();
  RunReloadWhileQueuedScenario();

  std::cout << "detector_reload_atomicity_smoke: ok\n";
  return 0;
}
