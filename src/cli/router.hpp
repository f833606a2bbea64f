#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <istream>
#include <ostream>

namespace coresidency::cli {

// Options shared by `replay` and `run`.
struct StreamOptions {
  std::filesystem::path config_path;
  std::filesystem::path batches_path;
  std::chrono::milliseconds poll_interval{500};
  bool watch_configuration = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Feeds a JSON Lines batch stream through a full control loop and writes one
// decision record per mitigation transition to `decisions`. Blank lines and
// lines starting with '#' are skipped.
//
// Returns a process exit code:
//   0  => every batch was applied
//   1  => the stream could not be read
//   10 => the configuration failed to load
//   20 => at least one batch was rejected
int ExecuteStream(const StreamOptions& options, std::istream& batches, std::ostream& decisions);

// Routes `coresidency` subcommands and returns process exit codes:
//   0 => success
//   1 => command failed after valid invocation
//   2 => usage error (unknown command / invalid args)
//   10 => configuration invalid
//   20 => one or more sample batches rejected
int Dispatch(int argc, char** argv);

} // namespace coresidency::cli
