#include "runtime/control_loop.hpp"

#include <string>
#include <utility>
#include <variant>

namespace coresidency::runtime {

ControlLoop::ControlLoop(ControlLoopOptions options, events::EventBus& bus,
                         core::logging::Logger& logger)
    : options_(std::move(options)), bus_(bus), logger_(logger),
      manager_(options_.config_path, bus, logger, options_.poll_interval) {}

ControlLoop::~ControlLoop() {
  Stop();
}

bool ControlLoop::Start(core::errors::DetectorError& error) {
  if (Running()) {
    return core::errors::SetDetectorError(error,
                                          core::errors::DetectorErrorCode::kMalformedConfiguration,
                                          "control loop already running");
  }

  if (!manager_.Load(error)) {
    return false;
  }
  const config::ConfigurationPtr configuration = manager_.Current();
  if (detector_ == nullptr) {
    detector_ = std::make_unique<detector::CoResidencyDetector>(configuration, bus_, logger_);
  } else {
    detector_->OnConfigurationReloaded(configuration);
  }

  {
    std::lock_guard<std::mutex> lock(queue_mu_);
    accepting_ = true;
    stop_requested_ = false;
  }
  BindSubscriptions(configuration->event_names);
  ingestion_ = std::thread(&ControlLoop::IngestionLoop, this);

  if (options_.watch_configuration) {
    std::string watch_error;
    if (!manager_.Start(watch_error)) {
      Stop();
      return core::errors::SetDetectorError(
          error, core::errors::DetectorErrorCode::kMalformedConfiguration, watch_error);
    }
  }

  logger_.Info("control loop started",
               {{"config", options_.config_path.string()},
                {"watch", options_.watch_configuration ? "true" : "false"}});
  error.Clear();
  return true;
}

void ControlLoop::Stop() {
  // Watcher first: no reload may race the shutdown of the ingestion thread.
  manager_.Stop();

  {
    std::lock_guard<std::mutex> lock(queue_mu_);
    if (!accepting_ && !ingestion_.joinable()) {
      return;
    }
    accepting_ = false;
    stop_requested_ = true;
  }
  queue_cv_.notify_all();
  if (ingestion_.joinable()) {
    ingestion_.join();
  }

  UnbindSubscriptions();

  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(queue_mu_);
    dropped = queue_.size();
    stats_.batches_dropped += dropped;
    queue_.clear();
  }
  idle_cv_.notify_all();

  logger_.Info("control loop stopped", {{"dropped_batches", std::to_string(dropped)}});
}

bool ControlLoop::Running() const {
  std::lock_guard<std::mutex> lock(queue_mu_);
  return accepting_;
}

bool ControlLoop::Publish(detector::SampleBatch batch) {
  std::string event_name;
  {
    std::lock_guard<std::mutex> lock(bind_mu_);
    event_name = sample_event_name_;
  }
  if (event_name.empty() || !Running()) {
    return false;
  }
  bus_.Emit(event_name, std::move(batch));
  return true;
}

void ControlLoop::WaitForIdle() {
  std::unique_lock<std::mutex> lock(queue_mu_);
  idle_cv_.wait(lock, [this] { return (queue_.empty() && !busy_) || stop_requested_; });
}

std::uint64_t ControlLoop::CurrentBatchOrdinal() const {
  std::lock_guard<std::mutex> lock(queue_mu_);
  return current_ordinal_;
}

ControlLoop::Stats ControlLoop::GetStats() const {
  std::lock_guard<std::mutex> lock(queue_mu_);
  return stats_;
}

void ControlLoop::BindSubscriptions(const config::EventNames& names) {
  std::lock_guard<std::mutex> lock(bind_mu_);
  if (sample_token_ == 0 || names.sample_event != sample_event_name_) {
    if (sample_token_ != 0) {
      bus_.Unsubscribe(sample_token_);
    }
    sample_event_name_ = names.sample_event;
    sample_token_ = bus_.Subscribe(
        sample_event_name_, [this](const events::EventPayload& payload) { OnSampleEvent(payload); });
  }
  if (reload_token_ == 0 || names.configuration_reloaded != reload_event_name_) {
    if (reload_token_ != 0) {
      bus_.Unsubscribe(reload_token_);
    }
    reload_event_name_ = names.configuration_reloaded;
    reload_token_ = bus_.Subscribe(reload_event_name_, [this](const events::EventPayload& payload) {
      OnConfigurationEvent(payload);
    });
  }
}

void ControlLoop::UnbindSubscriptions() {
  std::lock_guard<std::mutex> lock(bind_mu_);
  if (sample_token_ != 0) {
    bus_.Unsubscribe(sample_token_);
    sample_token_ = 0;
  }
  if (reload_token_ != 0) {
    bus_.Unsubscribe(reload_token_);
    reload_token_ = 0;
  }
  sample_event_name_.clear();
  reload_event_name_.clear();
}

void ControlLoop::OnSampleEvent(const events::EventPayload& payload) {
  const auto* batch = std::get_if<detector::SampleBatch>(&payload);
  if (batch == nullptr) {
    logger_.Warn("ignoring sample event without a sample batch payload");
    return;
  }

  {
    std::lock_guard<std::mutex> lock(queue_mu_);
    if (!accepting_) {
      ++stats_.batches_dropped;
      return;
    }
    queue_.push_back(QueuedBatch{.ordinal = next_ordinal_++, .batch = *batch});
    ++stats_.batches_queued;
  }
  queue_cv_.notify_one();
}

void ControlLoop::OnConfigurationEvent(const events::EventPayload& payload) {
  const auto* configuration = std::get_if<config::ConfigurationPtr>(&payload);
  if (configuration == nullptr || *configuration == nullptr) {
    logger_.Warn("ignoring configuration event without a configuration payload");
    return;
  }
  if (detector_ == nullptr || !detector_->OnConfigurationReloaded(*configuration)) {
    return;
  }

  bool renamed = false;
  {
    std::lock_guard<std::mutex> lock(bind_mu_);
    renamed = (*configuration)->event_names.sample_event != sample_event_name_ ||
              (*configuration)->event_names.configuration_reloaded != reload_event_name_;
  }
  if (renamed) {
    BindSubscriptions((*configuration)->event_names);
    logger_.Info("event subscriptions rebound",
                 {{"sample_event", (*configuration)->event_names.sample_event},
                  {"reload_event", (*configuration)->event_names.configuration_reloaded}});
  }
}

void ControlLoop::IngestionLoop() {
  while (true) {
    QueuedBatch next;
    {
      std::unique_lock<std::mutex> lock(queue_mu_);
      queue_cv_.wait(lock, [this] { return stop_requested_ || !queue_.empty(); });
      if (stop_requested_) {
        break;
      }
      next = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
      current_ordinal_ = next.ordinal;
    }

    core::errors::DetectorError error;
    const bool accepted = detector_->OnSampleBatch(next.batch, error);
    if (!accepted) {
      logger_.Warn("batch not applied", {{"batch", std::to_string(next.ordinal)},
                                         {"error", core::errors::FormatDetectorError(error)}});
    }

    {
      std::lock_guard<std::mutex> lock(queue_mu_);
      if (accepted) {
        ++stats_.batches_accepted;
      } else {
        ++stats_.batches_rejected;
      }
      busy_ = false;
    }
    idle_cv_.notify_all();
  }

  {
    std::lock_guard<std::mutex> lock(queue_mu_);
    busy_ = false;
  }
  idle_cv_.notify_all();
}

} // namespace coresidency::runtime
