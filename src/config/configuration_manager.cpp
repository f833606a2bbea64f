#include "config/configuration_manager.hpp"

#include "config/configuration_parser.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace coresidency::config {

ConfigurationManager::ConfigurationManager(fs::path path, events::EventBus& bus,
                                           core::logging::Logger& logger,
                                           const std::chrono::milliseconds poll_interval)
    : path_(std::move(path)), bus_(bus), logger_(logger),
      poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds(1)) {}

ConfigurationManager::~ConfigurationManager() {
  Stop();
}

ConfigurationManager::FileStamp ConfigurationManager::ReadStamp() const {
  FileStamp stamp;
  std::error_code ec;
  if (!fs::exists(path_, ec) || ec) {
    return stamp;
  }
  const auto mtime = fs::last_write_time(path_, ec);
  if (ec) {
    return stamp;
  }
  const auto size = fs::file_size(path_, ec);
  if (ec) {
    return stamp;
  }
  stamp.exists = true;
  stamp.mtime = mtime;
  stamp.size = size;
  return stamp;
}

bool ConfigurationManager::ReadConfiguration(ConfigurationPtr& configuration,
                                             core::errors::DetectorError& error) {
  Configuration parsed;
  ConfigurationReport report;
  if (!LoadConfigurationFile(path_, parsed, report, error)) {
    logger_.Error("configuration rejected", {{"path", path_.string()},
                                             {"error", core::errors::FormatDetectorError(error)}});
    for (const auto& issue : report.issues) {
      logger_.Error("configuration issue", {{"path", issue.path}, {"message", issue.message}});
    }
    return false;
  }
  configuration = MakeConfigurationPtr(std::move(parsed));
  return true;
}

bool ConfigurationManager::Load(core::errors::DetectorError& error) {
  std::lock_guard<std::mutex> reload_lock(reload_mu_);
  const FileStamp stamp = ReadStamp();

  ConfigurationPtr loaded;
  if (!ReadConfiguration(loaded, error)) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(current_mu_);
    current_ = loaded;
  }
  {
    std::lock_guard<std::mutex> lock(watch_mu_);
    last_stamp_ = stamp;
  }
  logger_.Info("configuration loaded",
               {{"path", path_.string()}, {"version", loaded->version}});
  error.Clear();
  return true;
}

bool ConfigurationManager::ReloadNow(core::errors::DetectorError& error) {
  std::lock_guard<std::mutex> reload_lock(reload_mu_);

  ConfigurationPtr reloaded;
  if (!ReadConfiguration(reloaded, error)) {
    std::lock_guard<std::mutex> lock(current_mu_);
    ++stats_.reloads_rejected;
    if (current_ != nullptr) {
      logger_.Warn("keeping previous configuration", {{"version", current_->version}});
    }
    return false;
  }

  ConfigurationPtr previous;
  {
    std::lock_guard<std::mutex> lock(current_mu_);
    previous = current_;
    current_ = reloaded;
    ++stats_.reloads_applied;
  }

  const std::string& event_name = previous != nullptr
                                      ? previous->event_names.configuration_reloaded
                                      : reloaded->event_names.configuration_reloaded;
  logger_.Info("configuration reload published",
               {{"version", reloaded->version}, {"event", event_name}});
  bus_.Emit(event_name, reloaded);
  error.Clear();
  return true;
}

ConfigurationPtr ConfigurationManager::Current() const {
  std::lock_guard<std::mutex> lock(current_mu_);
  return current_;
}

bool ConfigurationManager::Start(std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(watch_mu_);
  if (running_) {
    error = "configuration watcher already running";
    return false;
  }
  if (!last_stamp_.exists) {
    last_stamp_ = ReadStamp();
  }
  stop_requested_ = false;
  running_ = true;
  watcher_ = std::thread(&ConfigurationManager::WatchLoop, this);
  logger_.Debug("configuration watcher started",
                {{"path", path_.string()}, {"poll_ms", std::to_string(poll_interval_.count())}});
  return true;
}

void ConfigurationManager::Stop() {
  {
    std::lock_guard<std::mutex> lock(watch_mu_);
    if (!running_ && !watcher_.joinable()) {
      return;
    }
    stop_requested_ = true;
  }
  watch_cv_.notify_all();
  if (watcher_.joinable()) {
    watcher_.join();
  }
  {
    std::lock_guard<std::mutex> lock(watch_mu_);
    running_ = false;
  }
  logger_.Debug("configuration watcher stopped", {{"path", path_.string()}});
}

bool ConfigurationManager::Running() const {
  std::lock_guard<std::mutex> lock(watch_mu_);
  return running_;
}

ConfigurationManager::Stats ConfigurationManager::GetStats() const {
  std::lock_guard<std::mutex> lock(current_mu_);
  return stats_;
}

void ConfigurationManager::WatchLoop() {
  std::unique_lock<std::mutex> lock(watch_mu_);
  while (!stop_requested_) {
    watch_cv_.wait_for(lock, poll_interval_, [this] { return stop_requested_; });
    if (stop_requested_) {
      break;
    }

    const FileStamp stamp = ReadStamp();
    if (stamp == last_stamp_) {
      continue;
    }
    last_stamp_ = stamp;
    if (!stamp.exists) {
      logger_.Warn("configuration file disappeared", {{"path", path_.string()}});
      continue;
    }

    // Reload outside the watch lock so Stop() never waits on a parse.
    lock.unlock();
    logger_.Info("configuration file changed", {{"path", path_.string()}});
    core::errors::DetectorError error;
    if (!ReloadNow(error)) {
      logger_.Warn("configuration reload failed",
                   {{"error", core::errors::FormatDetectorError(error)}});
    }
    lock.lock();
  }
}

} // namespace coresidency::config
