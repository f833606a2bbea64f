#include "cli/router.hpp"
#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/detector_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace cli = coresidency::cli;
namespace common = coresidency::tests::common;
namespace fs = std::filesystem;
using coresidency::core::logging::LogLevel;

namespace {

std::string ConnectionsLine(double host_one) {
  std::string line = "{";
  for (const char* host : {"1", "2", "3", "4", "5"}) {
    const double value = std::string(host) == "1" ? host_one : 2.5;
    if (line.size() > 1) {
      line += ",";
    }
    line += "\"" + std::string(host) + "\":{\"Activity\":true,\"NrConnections\":" +
            coresidency::core::FormatJsonNumber(value) + "}";
  }
  return line + "}\n";
}

// Warm-up, three spikes on host 1, three calm batches.
std::string ActivationStream() {
  std::string stream = "# warm-up\n" + ConnectionsLine(2.5) + "\n";
  for (int i = 0; i < 3; ++i) {
    stream += ConnectionsLine(7.0);
  }
  for (int i = 0; i < 3; ++i) {
    stream += ConnectionsLine(2.5);
  }
  return stream;
}

cli::StreamOptions Options(const fs::path& config_path) {
  cli::StreamOptions options;
  options.config_path = config_path;
  options.log_level = LogLevel::kError;
  return options;
}

int Replay(const fs::path& config_path, const std::string& stream, std::string& decisions) {
  std::istringstream input(stream);
  std::ostringstream output;
  const int exit_code = cli::ExecuteStream(Options(config_path), input, output);
  decisions = output.str();
  return exit_code;
}

} // namespace

int main() {
  const common::ScopedTempDir temp_root("coresidency-cli-replay");
  const fs::path config_path = temp_root / "configuration.json";
  common::ConfigurationFixture fixture;
  fixture.thresholds = {{"NrConnections", 1.0}};
  common::WriteFixtureFile(config_path, common::ToConfigurationJson(fixture));

  const std::string expected = "{\"batch\":4,\"event\":\"MitigationStart\",\"host\":\"1\"}\n"
                               "{\"batch\":7,\"event\":\"MitigationStop\",\"host\":\"1\"}\n";

  std::string decisions;
  if (Replay(config_path, ActivationStream(), decisions) != 0) {
    common::Fail("clean replay must exit 0");
  }
  if (decisions != expected) {
    common::Fail("unexpected decision records:\n" + decisions);
  }

  // Undecodable lines do not consume a batch ordinal but fail the run.
  const std::string with_garbage = "not json at all\n" + ActivationStream();
  if (Replay(config_path, with_garbage, decisions) != 20) {
    common::Fail("undecodable line must exit 20");
  }
  if (decisions != expected) {
    common::Fail("undecodable line must not shift batch ordinals:\n" + decisions);
  }

  const std::string mismatched =
      ActivationStream() + "{\"1\":{\"Activity\":1,\"NrConnections\":2,\"Latency\":3}}\n";
  if (Replay(config_path, mismatched, decisions) != 20) {
    common::Fail("rejected batch must exit 20");
  }

  if (Replay(temp_root / "missing.json", ActivationStream(), decisions) != 10 ||
      !decisions.empty()) {
    common::Fail("missing configuration must exit 10 without decisions");
  }

  const fs::path batches_path = temp_root / "batches.jsonl";
  common::WriteFixtureFile(batches_path, ActivationStream());
  const std::string config_arg = config_path.string();
  const std::string batches_arg = batches_path.string();

  if (common::DispatchArgs({"coresidency", "replay", config_arg, batches_arg, "--log-level",
                            "error"}) != 0) {
    common::Fail("replay through the router must exit 0");
  }
  if (common::DispatchArgs({"coresidency", "replay", config_arg}) != 2) {
    common::Fail("replay without a batch stream must be a usage error");
  }
  if (common::DispatchArgs({"coresidency", "replay", config_arg, batches_arg, "--poll-ms", "5"}) !=
      2) {
    common::Fail("replay must reject --poll-ms");
  }
  if (common::DispatchArgs({"coresidency", "replay", config_arg, batches_arg, "--log-level",
                            "loud"}) != 2) {
    common::Fail("unknown log level must be a usage error");
  }
  if (common::DispatchArgs({"coresidency", "replay", config_arg,
                            (temp_root / "absent.jsonl").string()}) != 1) {
    common::Fail("missing batch stream must exit 1");
  }
  if (common::DispatchArgs({"coresidency", "run", config_arg, "--poll-ms", "0"}) != 2) {
    common::Fail("run must reject a non-positive --poll-ms");
  }

  std::cout << "cli_replay_smoke: ok\n";
  return 0;
}
