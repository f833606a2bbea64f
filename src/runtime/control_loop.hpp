#pragma once

#include "config/configuration.hpp"
#include "config/configuration_manager.hpp"
#include "core/errors/detector_error.hpp"
#include "core/logging/logger.hpp"
#include "detector/coresidency_detector.hpp"
#include "detector/sample_batch.hpp"
#include "events/event_bus.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace coresidency::runtime {

struct ControlLoopOptions {
  std::filesystem::path config_path;
  std::chrono::milliseconds poll_interval{500};

  // When false the configuration is loaded once and never watched.
  bool watch_configuration = true;
};

// Wires the bus, the configuration manager and the detector together and owns
// the ingestion thread.
//
// Batches reach the detector through the bus: anything emitted under the
// active SampleEvent wire name is queued and processed in FIFO order on the
// ingestion thread. Reloads arrive under the ConfigurationReloaded wire name;
// when a reload renames either of those two events the subscriptions follow.
//
// Stop() stops the watcher first, then the ingestion thread. Batches still
// queued at that point are dropped (and counted); nothing is emitted after
// Stop() returns.
class ControlLoop {
public:
  struct Stats {
    std::uint64_t batches_queued = 0;
    std::uint64_t batches_accepted = 0;
    std::uint64_t batches_rejected = 0;
    std::uint64_t batches_dropped = 0;
  };

  ControlLoop(ControlLoopOptions options, events::EventBus& bus, core::logging::Logger& logger);
  ~ControlLoop();

  ControlLoop(const ControlLoop&) = delete;
  ControlLoop& operator=(const ControlLoop&) = delete;

  // Loads the configuration, builds the detector, subscribes and starts the
  // threads. MALFORMED_CONFIGURATION when the initial load fails.
  bool Start(core::errors::DetectorError& error);

  void Stop();

  bool Running() const;

  // Emits `batch` on the bus under the current SampleEvent wire name.
  // Returns false when the loop is not running.
  bool Publish(detector::SampleBatch batch);

  // Blocks until the queue is empty and no batch is in flight, or the loop
  // stops.
  void WaitForIdle();

  // 1-based ordinal of the batch being processed right now. Mitigation
  // handlers run on the ingestion thread and can use it to tag decisions.
  std::uint64_t CurrentBatchOrdinal() const;

  // Null before Start().
  const detector::CoResidencyDetector* Detector() const { return detector_.get(); }

  config::ConfigurationManager& Configuration() { return manager_; }

  Stats GetStats() const;

private:
  struct QueuedBatch {
    std::uint64_t ordinal = 0;
    detector::SampleBatch batch;
  };

  void BindSubscriptions(const config::EventNames& names);
  void UnbindSubscriptions();
  void OnSampleEvent(const events::EventPayload& payload);
  void OnConfigurationEvent(const events::EventPayload& payload);
  void IngestionLoop();

  const ControlLoopOptions options_;
  events::EventBus& bus_;
  core::logging::Logger& logger_;
  config::ConfigurationManager manager_;
  std::unique_ptr<detector::CoResidencyDetector> detector_;

  // Guards the subscription tokens and the names they are bound to.
  mutable std::mutex bind_mu_;
  events::SubscriptionToken sample_token_ = 0;
  events::SubscriptionToken reload_token_ = 0;
  std::string sample_event_name_;
  std::string reload_event_name_;

  mutable std::mutex queue_mu_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<QueuedBatch> queue_;
  bool accepting_ = false;
  bool stop_requested_ = false;
  bool busy_ = false;
  std::uint64_t next_ordinal_ = 1;
  std::uint64_t current_ordinal_ = 0;
  Stats stats_;

  std::thread ingestion_;
};

} // namespace coresidency::runtime
