#pragma once

#include "config/configuration.hpp"
#include "core/errors/detector_error.hpp"
#include "core/logging/logger.hpp"
#include "events/event_bus.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

namespace coresidency::config {

// Owns the active configuration snapshot for one file and publishes reloads.
//
// Threading:
// - Current() is safe from any thread.
// - ReloadNow() calls are serialized; the watcher thread uses the same path.
// - Start() spawns a watcher thread that polls the file's modification time
//   and size every `poll_interval`. Stop() is idempotent and joins it.
class ConfigurationManager {
public:
  struct Stats {
    std::uint64_t reloads_applied = 0;
    std::uint64_t reloads_rejected = 0;
  };

  ConfigurationManager(std::filesystem::path path, events::EventBus& bus,
                       core::logging::Logger& logger,
                       std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));
  ~ConfigurationManager();

  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;

  // Initial load. Installs the snapshot without emitting a reload event.
  bool Load(core::errors::DetectorError& error);

  // Re-reads the file. On success the snapshot is swapped and
  // ConfigurationReloaded is emitted under the wire name of the snapshot being
  // replaced. On failure every issue is logged and the previous snapshot stays.
  bool ReloadNow(core::errors::DetectorError& error);

  // Null until Load() succeeds.
  ConfigurationPtr Current() const;

  bool Start(std::string& error);
  void Stop();
  bool Running() const;

  const std::filesystem::path& Path() const { return path_; }

  Stats GetStats() const;

private:
  struct FileStamp {
    bool exists = false;
    std::filesystem::file_time_type mtime{};
    std::uintmax_t size = 0;

    bool operator==(const FileStamp& other) const = default;
  };

  FileStamp ReadStamp() const;
  bool ReadConfiguration(ConfigurationPtr& configuration, core::errors::DetectorError& error);
  void WatchLoop();

  const std::filesystem::path path_;
  events::EventBus& bus_;
  core::logging::Logger& logger_;
  const std::chrono::milliseconds poll_interval_;

  mutable std::mutex current_mu_;
  ConfigurationPtr current_;
  Stats stats_;

  std::mutex reload_mu_;

  mutable std::mutex watch_mu_;
  std::condition_variable watch_cv_;
  bool stop_requested_ = false;
  bool running_ = false;
  FileStamp last_stamp_;
  std::thread watcher_;
};

} // namespace coresidency::config
