#include "cli/router.hpp"

#include "config/configuration_parser.hpp"
#include "core/errors/exit_codes.hpp"
#include "detector/sample_batch.hpp"
#include "events/event_bus.hpp"
#include "events/event_model.hpp"
#include "runtime/control_loop.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace coresidency::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigurationInvalid =
    core::errors::ToInt(core::errors::ExitCode::kConfigurationInvalid);
constexpr int kExitBatchRejected = core::errors::ToInt(core::errors::ExitCode::kBatchRejected);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  coresidency validate <config.json>\n"
      << "  coresidency replay <config.json> <batches.jsonl> "
         "[--log-level <debug|info|warn|error>]\n"
      << "  coresidency run <config.json> [--poll-ms <n>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  coresidency version\n";
}

// Writes mitigation decisions as JSON Lines and follows wire-name changes
// announced by configuration reloads.
class DecisionWriter {
public:
  DecisionWriter(events::EventBus& bus, const runtime::ControlLoop& loop, std::ostream& out)
      : bus_(bus), loop_(loop), out_(out) {}

  ~DecisionWriter() { Unbind(); }

  DecisionWriter(const DecisionWriter&) = delete;
  DecisionWriter& operator=(const DecisionWriter&) = delete;

  void Bind(const config::EventNames& names) {
    std::lock_guard<std::mutex> lock(mu_);
    UnbindLocked();
    names_ = names;
    tokens_.push_back(bus_.Subscribe(names.start_mitigation, [this](const auto& payload) {
      Write(events::EventType::kStartMitigation, payload);
    }));
    tokens_.push_back(bus_.Subscribe(names.stop_mitigation, [this](const auto& payload) {
      Write(events::EventType::kStopMitigation, payload);
    }));
    tokens_.push_back(
        bus_.Subscribe(names.configuration_reloaded, [this](const events::EventPayload& payload) {
          const auto* configuration = std::get_if<config::ConfigurationPtr>(&payload);
          if (configuration != nullptr && *configuration != nullptr) {
            Bind((*configuration)->event_names);
          }
        }));
  }

  void Unbind() {
    std::lock_guard<std::mutex> lock(mu_);
    UnbindLocked();
  }

  std::uint64_t Count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return written_;
  }

private:
  void UnbindLocked() {
    for (const auto token : tokens_) {
      bus_.Unsubscribe(token);
    }
    tokens_.clear();
  }

  void Write(events::EventType type, const events::EventPayload& payload) {
    const auto* host = std::get_if<detector::HostId>(&payload);
    if (host == nullptr) {
      return;
    }
    std::lock_guard<std::mutex> lock(mu_);
    const events::DecisionRecord record{
        .batch = loop_.CurrentBatchOrdinal(),
        .event = events::WireName(names_, type),
        .host = *host,
    };
    out_ << events::ToJson(record) << '\n';
    out_.flush();
    ++written_;
  }

  events::EventBus& bus_;
  const runtime::ControlLoop& loop_;
  std::ostream& out_;

  mutable std::mutex mu_;
  config::EventNames names_;
  std::vector<events::SubscriptionToken> tokens_;
  std::uint64_t written_ = 0;
};

std::string_view TrimLine(std::string_view line) {
  const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!line.empty() && is_space(line.front())) {
    line.remove_prefix(1);
  }
  while (!line.empty() && is_space(line.back())) {
    line.remove_suffix(1);
  }
  return line;
}

bool ValidateInputPath(const fs::path& path, std::string_view what, std::string& error) {
  if (path.empty()) {
    error = std::string(what) + " path cannot be empty";
    return false;
  }
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = std::string(what) + " file not found: " + path.string();
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = std::string(what) + " path must point to a regular file: " + path.string();
    return false;
  }
  return true;
}

// Parses `<positional...> [--log-level L] [--poll-ms N]`. `--poll-ms` is only
// accepted when `allow_poll` is set.
bool ParseStreamOptions(const std::vector<std::string_view>& args, std::size_t positional_count,
                        bool allow_poll, StreamOptions& options, std::string& error) {
  std::vector<std::string_view> positional;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      if (!core::logging::ParseLogLevel(args[i + 1], options.log_level, error)) {
        return false;
      }
      ++i;
      continue;
    }
    if (token == "--poll-ms" && allow_poll) {
      if (i + 1 >= args.size()) {
        error = "missing value for --poll-ms";
        return false;
      }
      const std::string_view raw = args[i + 1];
      long long poll_ms = 0;
      const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), poll_ms);
      if (ec != std::errc() || ptr != raw.data() + raw.size() || poll_ms <= 0) {
        error = "invalid --poll-ms '" + std::string(raw) + "' (expected a positive integer)";
        return false;
      }
      options.poll_interval = std::chrono::milliseconds(poll_ms);
      ++i;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    positional.push_back(token);
  }

  if (positional.size() != positional_count) {
    error = "expected " + std::to_string(positional_count) + " positional argument(s), got " +
            std::to_string(positional.size());
    return false;
  }
  options.config_path = fs::path(positional[0]);
  if (positional_count > 1) {
    options.batches_path = fs::path(positional[1]);
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "coresidency 0.1.0\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  std::string error;
  if (!ValidateInputPath(config_path, "configuration", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  config::Configuration configuration;
  config::ConfigurationReport report;
  core::errors::DetectorError load_error;
  if (!config::LoadConfigurationFile(config_path, configuration, report, load_error)) {
    if (report.issues.empty()) {
      std::cerr << "error: " << core::errors::FormatDetectorError(load_error) << '\n';
      return kExitFailure;
    }
    std::cerr << "invalid configuration: " << config_path.string() << '\n';
    for (const auto& issue : report.issues) {
      std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
    }
    return kExitConfigurationInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  if (!configuration.version.empty()) {
    std::cout << "version: " << configuration.version << '\n';
  }
  std::cout << "mitigation_enabled: " << (configuration.mitigation_enabled ? "true" : "false")
            << '\n';
  std::cout << "thresholds: " << configuration.thresholds.size() << '\n';
  return kExitSuccess;
}

int CommandReplay(const std::vector<std::string_view>& args) {
  StreamOptions options;
  std::string error;
  if (!ParseStreamOptions(args, 2, /*allow_poll=*/false, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!ValidateInputPath(options.batches_path, "batch stream", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::ifstream batches(options.batches_path, std::ios::binary);
  if (!batches) {
    std::cerr << "error: unable to open batch stream: " << options.batches_path.string() << '\n';
    return kExitFailure;
  }
  return ExecuteStream(options, batches, std::cout);
}

int CommandRun(const std::vector<std::string_view>& args) {
  StreamOptions options;
  options.watch_configuration = true;
  std::string error;
  if (!ParseStreamOptions(args, 1, /*allow_poll=*/true, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteStream(options, std::cin, std::cout);
}

} // namespace

int ExecuteStream(const StreamOptions& options, std::istream& batches, std::ostream& decisions) {
  core::logging::Logger logger(options.log_level);
  logger.SetNodeId(options.config_path.stem().string());

  events::EventBus bus(&logger);
  runtime::ControlLoop loop(
      runtime::ControlLoopOptions{
          .config_path = options.config_path,
          .poll_interval = options.poll_interval,
          .watch_configuration = options.watch_configuration,
      },
      bus, logger);

  core::errors::DetectorError error;
  if (!loop.Start(error)) {
    std::cerr << "error: " << core::errors::FormatDetectorError(error) << '\n';
    return kExitConfigurationInvalid;
  }

  DecisionWriter writer(bus, loop, decisions);
  writer.Bind(loop.Configuration().Current()->event_names);

  std::uint64_t line_number = 0;
  std::uint64_t undecodable = 0;
  std::string line;
  while (std::getline(batches, line)) {
    ++line_number;
    const std::string_view trimmed = TrimLine(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    detector::SampleBatch batch;
    core::errors::DetectorError decode_error;
    if (!detector::DecodeSampleBatchJson(trimmed, batch, decode_error)) {
      ++undecodable;
      logger.Error("undecodable batch line",
                   {{"line", std::to_string(line_number)},
                    {"error", core::errors::FormatDetectorError(decode_error)}});
      continue;
    }
    if (!loop.Publish(std::move(batch))) {
      logger.Error("control loop is not accepting batches", {{"line", std::to_string(line_number)}});
      break;
    }
  }
  const bool read_failed = batches.bad();

  loop.WaitForIdle();
  writer.Unbind();
  loop.Stop();

  const runtime::ControlLoop::Stats stats = loop.GetStats();
  logger.Info("batch stream finished",
              {{"lines", std::to_string(line_number)},
               {"accepted", std::to_string(stats.batches_accepted)},
               {"rejected", std::to_string(stats.batches_rejected + undecodable)},
               {"decisions", std::to_string(writer.Count())}});

  if (read_failed) {
    std::cerr << "error: failed while reading the batch stream\n";
    return kExitFailure;
  }
  if (stats.batches_rejected + undecodable > 0) {
    return kExitBatchRejected;
  }
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "replay") {
    return CommandReplay(args);
  }

  if (command == "run") {
    return CommandRun(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace coresidency::cli
