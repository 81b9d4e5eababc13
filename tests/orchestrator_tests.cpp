#include "remote_transport.hpp"
#include "sync_orchestrator.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace efsync::test;
namespace fs = std::filesystem;
using std::chrono::milliseconds;

namespace {

// In-memory stand-in for the archive host. Failures are scripted per path.
class FakeRemote : public RemoteTransport {
public:
  Result<void> ping() override { return Result<void>::Ok(); }

  Result<RemoteAck> push(const FileRecord& source, const std::string& remote_path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++push_calls_;
    auto failure = failures_.find(remote_path);
    if(failure != failures_.end() && failure->second.remaining > 0) {
      --failure->second.remaining;
      return Result<RemoteAck>::Error(failure->second.error);
    }
    auto content = read_file(source.absolute_path);
    files_[remote_path] = content;
    pushed_.push_back(remote_path);
    RemoteAck ack;
    ack.bytes = content.size();
    ack.fingerprint = sha256_hex(content);
    return Result<RemoteAck>::Ok(ack);
  }

  Result<FileRecord> pull(const std::string& remote_path, const fs::path& local_destination) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(remote_path);
    if(it == files_.end()) {
      return Result<FileRecord>::Error(make_error(ErrorKind::SourceMissing, "no such file", remote_path));
    }
    write_file(local_destination, it->second);
    pulled_.push_back(remote_path);
    FileRecord record;
    record.relative_path = remote_path;
    record.absolute_path = local_destination;
    record.size = it->second.size();
    record.fingerprint = sha256_hex(it->second);
    return Result<FileRecord>::Ok(record);
  }

  Result<std::vector<FileRecord>> manifest() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FileRecord> out;
    for(const auto& entry : files_) {
      FileRecord record;
      record.relative_path = entry.first;
      record.size = entry.second.size();
      record.fingerprint = sha256_hex(entry.second);
      out.push_back(record);
    }
    return Result<std::vector<FileRecord>>::Ok(out);
  }

  void fail(const std::string& path, ErrorKind kind, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[path] = Failure{make_error(kind, "scripted failure", path), times};
  }

  void put(const std::string& path, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = content;
  }

  int push_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return push_calls_;
  }

  std::vector<std::string> pushed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushed_;
  }

  std::vector<std::string> pulled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pulled_;
  }

private:
  struct Failure {
    SyncError error;
    int remaining = 0;
  };

  mutable std::mutex mutex_;
  std::map<std::string, std::string> files_;
  std::map<std::string, Failure> failures_;
  std::vector<std::string> pushed_;
  std::vector<std::string> pulled_;
  int push_calls_ = 0;
};

struct Network {
  std::atomic<bool> up{true};

  ConnectionManager::Prober prober() {
    return [this](const Endpoint&, milliseconds) {
      ProbeResult result;
      result.reachable = up.load();
      if(!result.reachable) result.error = make_error(ErrorKind::ConnectionRefused, "down");
      return result;
    };
  }
};

SyncConfig test_config(const TempDir& dir) {
  SyncConfig config;
  config.source_root = dir / "source";
  config.local_root = dir / "local";
  config.archive_root = dir / "archive";
  config.state_dir = dir / "state";
  config.endpoint = Endpoint{"archive.test", 9400};
  config.workers = 1;
  config.cycle_interval = std::chrono::seconds(3600);
  config.probe_interval = std::chrono::seconds(3600);
  config.scan.stability_delay = milliseconds(0);
  config.retry.max_attempts = 3;
  config.retry.base_delay = milliseconds(1);
  config.retry.max_delay = milliseconds(4);
  config.connection.cache_ttl = milliseconds(0);
  config.queue.attempt_ceiling = 5;
  config.queue.fsync = false;
  config.transfer.sync_writes = false;
  fs::create_directories(config.source_root);
  fs::create_directories(config.archive_root);
  return config;
}

struct Harness {
  Harness(TestContext& ctx, SyncConfig config)
    : remote(std::make_shared<FakeRemote>()),
      events(std::make_shared<RecordingEventSink>()),
      orchestrator(std::move(config), ctx.logger, events, remote) {
    orchestrator.connections()->set_prober(network.prober());
  }

  Network network;
  std::shared_ptr<FakeRemote> remote;
  std::shared_ptr<RecordingEventSink> events;
  SyncOrchestrator orchestrator;
};

std::string status_of(const SyncResult& result) {
  return to_string(result.status);
}

void test_unreachable_endpoint_defers_then_drains_in_order(TestContext& ctx) {
  TempDir dir("orch_b");
  auto config = test_config(dir);
  write_file(config.source_root / "a.log", "alpha");
  write_file(config.source_root / "b.log", "bravo");
  write_file(config.source_root / "c.log", "charlie");
  Harness h(ctx, config);
  h.network.up = false;

  auto deferred = h.orchestrator.run_cycle();
  expect_eq(deferred.tasks_enqueued, 3u, "three tasks");
  expect_eq(deferred.deferred_tasks, 3u, "all deferred");
  expect_eq(status_of(deferred), std::string("PARTIAL"), "deferred work is partial");
  expect_eq(h.remote->push_calls(), 0, "no transfer attempts while unreachable");
  expect_eq(h.orchestrator.queue().depth(), 3u, "still queued");

  h.network.up = true;
  auto drained = h.orchestrator.drain_pending();
  expect_eq(drained.files_transferred, 3u, "all transferred");
  expect_eq(status_of(drained), std::string("SUCCESS"), "success");
  expect(h.remote->pushed() == std::vector<std::string>({"a.log", "b.log", "c.log"}), "enqueue order");
  expect_eq(h.orchestrator.queue().depth(), 0u, "queue empty");
  expect(h.events->count("endpoint_state_changed") >= 2, "transitions reported");
}

void test_unchanged_source_transfers_nothing(TestContext& ctx) {
  TempDir dir("orch_a");
  auto config = test_config(dir);
  write_file(config.source_root / "a.log", std::string(10, 'a'));
  write_file(config.source_root / "b.log", std::string(20, 'b'));
  Harness h(ctx, config);

  auto first = h.orchestrator.run_cycle();
  expect_eq(first.files_transferred, 2u, "first cycle pushes both");
  expect_eq(first.bytes_transferred, 30u, "bytes");
  auto second = h.orchestrator.run_cycle();
  expect_eq(second.tasks_enqueued, 0u, "nothing new");
  expect_eq(second.files_transferred, 0u, "nothing sent");
  expect_eq(status_of(second), std::string("SUCCESS"), "success");

  write_file(config.source_root / "b.log", std::string(21, 'b'));
  auto third = h.orchestrator.run_cycle();
  expect_eq(third.files_transferred, 1u, "only the modified file");
}

void test_transient_failures_are_retried(TestContext& ctx) {
  TempDir dir("orch_c");
  auto config = test_config(dir);
  write_file(config.source_root / "flaky.log", "data");
  Harness h(ctx, config);
  h.remote->fail("flaky.log", ErrorKind::ConnectionLost, 2);

  auto result = h.orchestrator.run_cycle();
  expect_eq(result.files_transferred, 1u, "succeeded");
  expect_eq(status_of(result), std::string("SUCCESS"), "retries inside the budget do not degrade the cycle");
  auto succeeded = h.events->of_type("task_succeeded");
  expect_eq(succeeded.size(), 1u, "one success event");
  expect_eq(succeeded[0].fields["attempts"].get<uint32_t>(), 3u, "three attempts");
}

void test_terminal_failure_does_not_block_others(TestContext& ctx) {
  TempDir dir("orch_d");
  auto config = test_config(dir);
  write_file(config.source_root / "a.log", "a");
  write_file(config.source_root / "full.log", "too big");
  write_file(config.source_root / "z.log", "z");
  Harness h(ctx, config);
  h.remote->fail("full.log", ErrorKind::DestinationFull, 100);

  auto result = h.orchestrator.run_cycle();
  expect_eq(result.files_transferred, 2u, "others processed");
  expect_eq(result.dead_tasks, 1u, "one dead");
  expect_eq(status_of(result), std::string("PARTIAL"), "partial");
  expect_eq(result.errors.size(), 1u, "one error");
  expect(result.errors[0].kind == ErrorKind::DestinationFull, "error kind surfaced");

  auto dead = h.orchestrator.dead_tasks();
  expect_eq(dead.size(), 1u, "dead list");
  expect_eq(dead[0].attempts, 1u, "not retried");
  expect_eq(h.events->count("task_dead"), 1u, "dead event");

  h.remote->fail("full.log", ErrorKind::DestinationFull, 0);
  expect_ok(h.orchestrator.retry_dead(dead[0].id), "operator retry");
  auto retried = h.orchestrator.drain_pending();
  expect_eq(retried.files_transferred, 1u, "retried task succeeds");
  expect(h.orchestrator.dead_tasks().empty(), "dead list empty");
}

void test_missing_source_root_fails_cycle(TestContext& ctx) {
  TempDir dir("orch_missing");
  auto config = test_config(dir);
  config.source_root = dir / "not-there";
  Harness h(ctx, config);
  auto result = h.orchestrator.run_cycle();
  expect_eq(status_of(result), std::string("FAILED"), "failed");
  expect(result.errors[0].kind == ErrorKind::ArchiveInaccessible, "global error");
  expect_eq(h.events->count("cycle_completed"), 1u, "cycle still reported");
}

void test_history_is_bounded(TestContext& ctx) {
  TempDir dir("orch_history");
  auto config = test_config(dir);
  config.result_history = 2;
  Harness h(ctx, config);
  for(int i = 0; i < 4; ++i) h.orchestrator.run_cycle();
  auto results = h.orchestrator.results();
  expect_eq(results.size(), 2u, "bounded");
  expect_eq(results[0].cycle, 3u, "oldest kept");
  expect_eq(results[1].cycle, 4u, "newest");
  auto status = h.orchestrator.status_snapshot();
  expect_eq(status.cycles, 4u, "cycles counted");
  expect(status.last_result && status.last_result->cycle == 4, "last result");
  expect_eq(status.to_json()["queue"]["depth"].get<std::size_t>(), 0u, "status json");
}

void test_queue_survives_restart(TestContext& ctx) {
  TempDir dir("orch_restart");
  auto config = test_config(dir);
  config.queue.database_path = config.state_dir / "queue.db";
  write_file(config.source_root / "a.log", "alpha");
  write_file(config.source_root / "b.log", "bravo");
  {
    Harness h(ctx, config);
    h.network.up = false;
    auto result = h.orchestrator.run_cycle();
    expect_eq(result.deferred_tasks, 2u, "deferred");
  }
  Harness h(ctx, config);
  auto result = h.orchestrator.run_cycle();
  expect_eq(result.tasks_enqueued, 0u, "file table persisted, nothing rescanned as new");
  expect_eq(result.files_transferred, 2u, "recovered tasks drained");
  expect(h.remote->pushed() == std::vector<std::string>({"a.log", "b.log"}), "order kept across restart");
}

void test_pull_direction(TestContext& ctx) {
  TempDir dir("orch_pull");
  auto config = test_config(dir);
  config.direction = SyncDirection::Pull;
  Harness h(ctx, config);
  h.remote->put("logs/one.log", "first");
  h.remote->put("two.log", "second");
  h.remote->put("../escape.log", "nope");

  auto result = h.orchestrator.run_cycle();
  expect_eq(result.files_transferred, 2u, "two pulled");
  expect_eq(read_file(config.local_root / "logs" / "one.log"), std::string("first"), "nested file");
  expect_eq(read_file(config.local_root / "two.log"), std::string("second"), "top-level file");
  expect(!fs::exists(dir / "escape.log"), "unsafe path ignored");

  auto again = h.orchestrator.run_cycle();
  expect_eq(again.tasks_enqueued, 0u, "local copies match the manifest");

  h.remote->put("two.log", "second, edited");
  auto third = h.orchestrator.run_cycle();
  expect_eq(third.files_transferred, 1u, "changed file pulled again");
  expect_eq(read_file(config.local_root / "two.log"), std::string("second, edited"), "updated");
}

void test_reconcile_volume_reports(TestContext& ctx) {
  TempDir dir("orch_media");
  auto config = test_config(dir);
  auto mount = dir / "mnt" / "EFIS";
  write_file(mount / "EFIS_DRIVE.txt", "id=EFIS-7\n");
  write_file(mount / "DEMO-20240501-143000.LOG", "t,alt\n");
  write_file(config.archive_root / "updates" / "nav.db", "navdata");
  Harness h(ctx, config);

  auto report = h.orchestrator.reconcile_volume(mount);
  expect(report.has_value(), "managed");
  expect_eq(report->extracted, 1u, "extracted");
  expect_eq(report->injected, 1u, "injected");
  expect_eq(read_file(mount / "nav.db"), std::string("navdata"), "update on the volume");
  expect_eq(h.events->count("volume_reconciled"), 1u, "event");

  auto second = h.orchestrator.reconcile_volume(mount);
  expect_eq(second->unchanged, 1u, "idempotent");
  expect_eq(second->extracted + second->injected, 0u, "nothing moved");

  fs::create_directories(dir / "mnt" / "OTHER");
  expect(!h.orchestrator.reconcile_volume(dir / "mnt" / "OTHER"), "unmanaged");
  expect_eq(h.events->count("volume_rejected"), 1u, "rejection event");
  expect(h.orchestrator.status_snapshot().last_volume_report.has_value(), "last report kept");
}

void test_events_drive_the_running_orchestrator(TestContext& ctx) {
  TempDir dir("orch_running");
  auto config = test_config(dir);
  write_file(config.source_root / "a.log", "alpha");
  auto mount = dir / "mnt" / "EFIS";
  write_file(mount / "EFIS_DRIVE.txt", "id=EFIS-9\n");
  write_file(mount / "DEMO-20240502-090000.LOG", "log");
  Harness h(ctx, config);
  h.network.up = false;

  expect_ok(h.orchestrator.start(), "start");
  expect(wait_for_condition([&] { return h.events->count("cycle_completed") >= 1; }, milliseconds(5000)),
         "first cycle runs on start");
  expect_eq(h.remote->push_calls(), 0, "held while down");

  h.orchestrator.notify_volume_inserted(mount);
  expect(wait_for_condition([&] { return h.events->count("volume_reconciled") >= 1; }, milliseconds(5000)),
         "volume handled from the event channel");
  expect(fs::exists(config.archive_root / "demo" / "2024-05-02_DEMO-20240502-090000.LOG"), "extracted");

  h.network.up = true;
  h.orchestrator.connections()->probe(*config.endpoint);
  expect(wait_for_condition([&] { return h.remote->pushed().size() == 1; }, milliseconds(5000)),
         "reconnection drains the queue");

  write_file(config.source_root / "b.log", "bravo");
  h.orchestrator.trigger_cycle();
  expect(wait_for_condition([&] { return h.remote->pushed().size() == 2; }, milliseconds(5000)),
         "triggered cycle");

  h.orchestrator.stop();
  expect(!h.orchestrator.status_snapshot().running, "stopped");
  expect_eq(std::string(to_string(h.orchestrator.status_snapshot().state)), std::string("STOPPED"), "state");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"unreachable_endpoint_defers_then_drains_in_order", test_unreachable_endpoint_defers_then_drains_in_order},
    {"unchanged_source_transfers_nothing", test_unchanged_source_transfers_nothing},
    {"transient_failures_are_retried", test_transient_failures_are_retried},
    {"terminal_failure_does_not_block_others", test_terminal_failure_does_not_block_others},
    {"missing_source_root_fails_cycle", test_missing_source_root_fails_cycle},
    {"history_is_bounded", test_history_is_bounded},
    {"queue_survives_restart", test_queue_survives_restart},
    {"pull_direction", test_pull_direction},
    {"reconcile_volume_reports", test_reconcile_volume_reports},
    {"events_drive_the_running_orchestrator", test_events_drive_the_running_orchestrator},
  };
  return run_tests("orchestrator", tests, argc, argv);
}
