#include "command_line_parser.hpp"
#include "errors.hpp"
#include "settings_manager.hpp"
#include "sync_config.hpp"
#include "test_runner_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

using namespace efsync::test;
namespace fs = std::filesystem;

namespace {

ParseOutcome parse_args(const std::vector<const char*>& args, SettingsManager& settings) {
  std::vector<const char*> argv{"efsyncd"};
  argv.insert(argv.end(), args.begin(), args.end());
  CommandLineParser parser;
  return parser.parse(static_cast<int>(argv.size()), argv.data(), settings);
}

bool mentions(const std::vector<std::string>& problems, const std::string& needle) {
  for(const auto& problem : problems) {
    if(problem.find(needle) != std::string::npos) return true;
  }
  return false;
}

void test_defaults(TestContext&) {
  SettingsManager settings;
  expect_eq(settings.get<std::string>("direction"), std::string("push"), "direction");
  expect_eq(settings.get<long long>("workers"), 2LL, "workers");
  expect_eq(settings.get<long long>("task_attempt_ceiling"), 5LL, "attempt ceiling");
  expect_eq(settings.get<std::string>("marker_file"), std::string("EFIS_DRIVE.txt"), "marker");
  expect(settings.get<bool>("readback_verify"), "readback on");
  expect(!settings.help_requested(), "no help");
}

void test_command_line(TestContext&) {
  SettingsManager settings;
  auto outcome = parse_args({"/data/out", "archive.local:9400", "--workers=4", "-z", "3",
                             "--verbose", "-x", "*.bak, *.swp", "--readback_verify", "off"}, settings);
  expect(outcome.ok, "parsed: " + outcome.error);
  expect_eq(settings.get<std::string>("source_root"), std::string("/data/out"), "first positional");
  expect_eq(settings.get<std::string>("endpoint"), std::string("archive.local:9400"), "second positional");
  expect_eq(settings.get<long long>("workers"), 4LL, "inline value");
  expect_eq(settings.get<long long>("compression_level"), 3LL, "alias with separate value");
  expect(settings.get<bool>("verbose"), "bare flag");
  expect(!settings.get<bool>("readback_verify"), "explicit false");
  auto excludes = settings.get<std::vector<std::string>>("exclude");
  expect(excludes == std::vector<std::string>({"*.bak", "*.swp"}), "comma list");
}

void test_command_line_errors(TestContext&) {
  {
    SettingsManager settings;
    auto outcome = parse_args({"--nonsense=1"}, settings);
    expect(!outcome.ok, "unknown option");
    expect(outcome.error.find("nonsense") != std::string::npos, "named in the error");
  }
  {
    SettingsManager settings;
    auto outcome = parse_args({"--workers=12"}, settings);
    expect(!outcome.ok, "out of range");
    expect_eq(settings.get<long long>("workers"), 2LL, "value unchanged");
  }
  {
    SettingsManager settings;
    auto outcome = parse_args({"--workers"}, settings);
    expect(!outcome.ok, "missing value");
  }
  {
    SettingsManager settings;
    auto outcome = parse_args({"a", "b:1", "c"}, settings);
    expect(!outcome.ok, "too many positionals");
  }
}

void test_environment_overrides_file(TestContext&) {
  TempDir dir("config_env");
  SettingsManager saved;
  std::string error;
  expect(saved.set_from_string("workers", "3", error), "set workers");
  expect(saved.set_from_string("endpoint", "host:1", error), "set endpoint");
  expect(saved.save_to_file(dir / "settings.json"), "saved");

  SettingsManager settings;
  expect(settings.load_from_file(dir / "settings.json"), "loaded");
  expect_eq(settings.get<long long>("workers"), 3LL, "file value");

  ::setenv("EFSYNC_WORKERS", "6", 1);
  ::setenv("EFSYNC_QUEUE_FSYNC", "no", 1);
  ::setenv("EFSYNC_RETRY_MAX_ATTEMPTS", "zero", 1);
  auto applied = settings.apply_environment("EFSYNC_");
  ::unsetenv("EFSYNC_WORKERS");
  ::unsetenv("EFSYNC_QUEUE_FSYNC");
  ::unsetenv("EFSYNC_RETRY_MAX_ATTEMPTS");

  expect_eq(applied, std::size_t{2}, "bad value ignored");
  expect_eq(settings.get<long long>("workers"), 6LL, "environment wins");
  expect(!settings.get<bool>("queue_fsync"), "bool from environment");
  expect_eq(settings.get<long long>("retry_max_attempts"), 3LL, "default kept");
  expect_eq(settings.get<std::string>("endpoint"), std::string("host:1"), "file value kept");
}

void test_from_settings(TestContext&) {
  SettingsManager settings;
  std::string error;
  expect(settings.set_from_string("source_root", "/data/out", error), "source");
  expect(settings.set_from_string("endpoint", "archive.local:9400", error), "endpoint");
  expect(settings.set_from_string("state_dir", "/var/lib/efsync", error), "state");
  expect(settings.set_from_string("retry_base_delay_ms", "250", error), "base delay");
  expect(settings.set_from_string("exclude", "*.bak", error), "exclude");

  auto config = SyncConfig::from_settings(settings);
  expect(config.endpoint.has_value(), "endpoint parsed");
  expect_eq(config.endpoint->host, std::string("archive.local"), "host");
  expect_eq(config.endpoint->port, uint16_t{9400}, "port");
  expect_eq(config.retry.base_delay.count(), 250LL, "delay");
  expect_eq(config.queue.database_path, fs::path("/var/lib/efsync/queue.db"), "queue under state_dir");
  expect_eq(config.index_path(), fs::path("/var/lib/efsync/source.index.db"), "index under state_dir");
  const auto& excludes = config.scan.exclude_patterns;
  expect(std::find(excludes.begin(), excludes.end(), "*.bak") != excludes.end(), "extra exclude kept");
  expect(std::find(excludes.begin(), excludes.end(), "efsync") != excludes.end(), "state dir excluded");
}

void test_from_settings_rejects_bad_configuration(TestContext&) {
  SettingsManager settings;
  std::string error;
  expect(settings.set_from_string("endpoint", "no-port-here", error), "accepted as a string");
  expect(settings.set_from_string("direction", "sideways", error), "accepted as a string");
  bool thrown = false;
  try {
    SyncConfig::from_settings(settings);
  } catch(const ConfigError& e) {
    thrown = true;
    std::string message = e.what();
    expect(message.find("host:port") != std::string::npos, "endpoint problem listed");
    expect(message.find("push or pull") != std::string::npos, "direction problem listed");
  }
  expect(thrown, "ConfigError thrown");
}

void test_validate(TestContext&) {
  SyncConfig config;
  config.state_dir = ".efsync";
  expect(mentions(config.validate(), "nothing to do"), "no endpoint, archive or server");

  config.endpoint = Endpoint{"host", 1};
  expect(mentions(config.validate(), "needs source_root"), "push without source");
  config.source_root = "/data";
  expect(config.validate().empty(), "minimal push config");

  config.direction = SyncDirection::Pull;
  expect(mentions(config.validate(), "needs local_root"), "pull without destination");
  config.local_root = "/incoming";

  config.retry.base_delay = std::chrono::milliseconds(500);
  config.retry.max_delay = std::chrono::milliseconds(100);
  config.workers = 0;
  config.serve = true;
  auto problems = config.validate();
  expect(mentions(problems, "retry_max_delay_ms"), "delay order");
  expect(mentions(problems, "workers"), "worker range");
  expect(mentions(problems, "serve_root"), "server without root");

  config.retry.max_delay = std::chrono::milliseconds(500);
  config.workers = 2;
  config.server.root = "/incoming/../incoming";
  expect(mentions(config.validate(), "must differ"), "server cannot serve the pull destination");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"command_line", test_command_line},
    {"command_line_errors", test_command_line_errors},
    {"environment_overrides_file", test_environment_overrides_file},
    {"from_settings", test_from_settings},
    {"from_settings_rejects_bad_configuration", test_from_settings_rejects_bad_configuration},
    {"validate", test_validate},
  };
  return run_tests("sync_config", tests, argc, argv);
}
