#include "media_patterns.hpp"
#include "media_reconciler.hpp"
#include "retry_policy.hpp"
#include "test_runner_utils.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace efsync::test;
namespace fs = std::filesystem;
using std::chrono::milliseconds;

namespace {

const char* kDemoLog = "DEMO-20240501-143000.LOG";
const char* kDemoArchiveName = "2024-05-01_DEMO-20240501-143000.LOG";

// A volume mount and an archive root side by side.
struct MediaFixture {
  explicit MediaFixture(const std::string& name) : dir(name) {
    fs::create_directories(mount());
    fs::create_directories(archive());
  }

  fs::path mount() const { return dir / "mnt" / "EFIS"; }
  fs::path archive() const { return dir / "archive"; }

  void mark_volume(const std::string& id = "EFIS-01") {
    write_file(mount() / "EFIS_DRIVE.txt", "id=" + id + "\n");
  }

  TempDir dir;
};

MediaReconciler make_reconciler(TestContext& ctx, uint64_t free_bytes = 1ull << 30) {
  MediaReconciler reconciler(MediaOptions{}, ctx.logger);
  reconciler.set_space_probe([free_bytes](const fs::path&) {
    return std::optional<VolumeSpace>(VolumeSpace{8ull << 30, free_bytes});
  });
  return reconciler;
}

RetryPolicy quick_retry(TestContext& ctx) {
  RetryOptions options;
  options.max_attempts = 2;
  options.base_delay = milliseconds(1);
  options.max_delay = milliseconds(2);
  return RetryPolicy(options, ctx.logger);
}

TransferOptions engine_options() {
  TransferOptions options;
  options.sync_writes = false;
  return options;
}

ReconcilePlan plan_ok(MediaReconciler& reconciler, const ManagedVolume& volume, const fs::path& archive) {
  auto plan = reconciler.reconcile(volume, archive);
  expect_ok(plan, "reconcile");
  return plan.data;
}

ReconcileReport run_session(TestContext& ctx, const ManagedVolume& volume, const ReconcilePlan& plan) {
  TransferEngine engine(engine_options(), nullptr, ctx.logger);
  auto retry = quick_retry(ctx);
  ReconcileSession session(volume, plan,
                           [&engine](TransferTask& task) { return engine.transfer(task); },
                           retry, 3, ctx.logger);
  auto report = session.run();
  expect_ok(report, "session");
  return report.data;
}

void test_pattern_helpers(TestContext&) {
  expect_eq(parse_version_tag("nav_v2.4.1.db").value_or(""), std::string("2.4.1"), "version with v");
  expect_eq(parse_version_tag("fw-10.4.bin").value_or(""), std::string("10.4"), "version with dash");
  expect(!parse_version_tag("notes.txt"), "no version");
  expect_eq(artifact_stem("NAV_v2.4.1.db"), std::string("nav.db"), "stem");
  expect(compare_versions("2.10", "2.9") > 0, "numeric comparison");
  expect(compare_versions("1.2", "1.2.0") == 0, "missing parts are zero");

  auto demo = parse_demo_log_name("DEMO-20240501-143000+2.LOG");
  expect(demo.has_value(), "demo log with flight");
  expect_eq(demo->date, std::string("2024-05-01"), "demo date");
  expect(demo->flight && *demo->flight == 2, "flight number");
  expect(!parse_demo_log_name("DEMO-20241301-143000.LOG"), "invalid month");
  expect(!parse_demo_log_name("DEMO-20240101-120000+99999999999.LOG"), "oversized flight number");
  auto long_flight = parse_demo_log_name("DEMO-20240101-120000+123456.LOG");
  expect(long_flight && long_flight->flight && *long_flight->flight == 123456, "six digit flight number");

  expect_eq(snapshot_timestamp("SNAP_20240501_101500.png").value_or(""), std::string("2024-05-01_101500"), "snap");
  expect_eq(normalize_date("5/1/2024").value_or(""), std::string("2024-05-01"), "us date");
  expect(!normalize_date("yesterday"), "not a date");
}

void test_identify_by_markers(TestContext& ctx) {
  MediaFixture fx("identify");
  auto reconciler = make_reconciler(ctx);
  expect(!reconciler.identify(fx.mount()), "no markers, not managed");

  fs::create_directories(fx.mount() / "DEMO");
  expect(!reconciler.identify(fx.mount()), "one secondary marker is not enough");
  write_file(fx.mount() / "NAV.DB", "nav");
  auto by_secondary = reconciler.identify(fx.mount());
  expect(by_secondary.has_value(), "two secondary markers");

  fx.mark_volume("EFIS-42");
  auto volume = reconciler.identify(fx.mount());
  expect(volume.has_value(), "primary marker");
  expect_eq(volume->logical_id, std::string("EFIS-42"), "id from the marker");
  expect_eq(volume->free_bytes, 1ull << 30, "space from the probe");
  expect(!reconciler.identify(fx.dir / "not-mounted"), "missing mount");
}

void test_logical_id_ignores_mount_name(TestContext& ctx) {
  MediaFixture fx("logical_id");
  write_file(fx.mount() / "EFIS_DRIVE.txt", "EFIS removable drive\n");
  auto reconciler = make_reconciler(ctx);
  auto first = reconciler.identify(fx.mount());

  auto moved = fx.dir / "mnt" / "USB-DISK-1";
  fs::rename(fx.mount(), moved);
  auto second = reconciler.identify(moved);
  expect(first && second, "both identified");
  expect_eq(second->logical_id, first->logical_id, "same volume, same id");
}

void test_plan_extracts_only_matching_files(TestContext& ctx) {
  MediaFixture fx("scenario_e");
  fx.mark_volume();
  write_file(fx.mount() / kDemoLog, "t,alt\n0,1500\n");
  write_file(fx.mount() / "notes.txt", "unrelated");
  write_file(fx.mount() / "DEMO-20240101-120000+99999999999.LOG", "not ours");

  auto reconciler = make_reconciler(ctx);
  auto volume = reconciler.identify(fx.mount());
  expect(volume.has_value(), "managed");
  auto plan = plan_ok(reconciler, *volume, fx.archive());
  expect_eq(plan.extracts.size(), 1u, "one extract");
  expect_eq(plan.extracts[0].source.relative_path, std::string(kDemoLog), "the demo log");
  expect(plan.extracts[0].destination == fx.archive() / "demo" / kDemoArchiveName, "dated archive name");
  expect(plan.injects.empty(), "nothing to inject");

  auto report = run_session(ctx, *volume, plan);
  expect_eq(report.extracted, 1u, "extracted");
  expect(!report.aborted, "completed");
  expect(fs::exists(fx.archive() / "demo" / kDemoArchiveName), "archived");
  expect(!fs::exists(fx.mount() / kDemoLog), "removed from the volume");
  expect_eq(read_file(fx.mount() / "notes.txt"), std::string("unrelated"), "unrecognized file untouched");
  expect(fs::exists(fx.mount() / "DEMO-20240101-120000+99999999999.LOG"), "oversized flight number left alone");
}

void test_snapshots_and_logbooks_are_extracted(TestContext& ctx) {
  MediaFixture fx("extract_kinds");
  fx.mark_volume();
  write_file(fx.mount() / "SNAP" / "SNAP_20240501_101500.png", "png");
  write_file(fx.mount() / "logbook.csv", "Date,Route\n2024-04-01,KPAO-KSQL\n2024-04-03,KSQL-KPAO\n");

  auto reconciler = make_reconciler(ctx);
  auto plan = plan_ok(reconciler, *reconciler.identify(fx.mount()), fx.archive());
  expect_eq(plan.extracts.size(), 2u, "two extracts");
  std::vector<std::string> destinations;
  for(const auto& extract : plan.extracts) {
    destinations.push_back(extract.destination.lexically_relative(fx.archive()).generic_string());
  }
  std::sort(destinations.begin(), destinations.end());
  expect_eq(destinations[0], std::string("demo/snapshots/2024-05-01_101500_SNAP_20240501_101500.png"), "snapshot");
  expect_eq(destinations[1], std::string("logbook/2024-04-01_to_2024-04-03_logbook_2entries.csv"), "logbook");
}

void test_injects_updates_and_is_idempotent(TestContext& ctx) {
  MediaFixture fx("inject");
  fx.mark_volume();
  write_file(fx.archive() / "updates" / "nav_v2.4.db", pattern_bytes(5000));
  write_file(fx.archive() / "updates" / "charts" / "area.bin", pattern_bytes(3000, 3));
  write_file(fx.archive() / "updates" / ".settings", "brightness=7\n");
  write_file(fx.mount() / kDemoLog, "log");

  auto reconciler = make_reconciler(ctx);
  auto volume = reconciler.identify(fx.mount());
  auto plan = plan_ok(reconciler, *volume, fx.archive());
  expect_eq(plan.injects.size(), 3u, "three injects");
  expect_eq(plan.inject_bytes, 8013u, "inject bytes");
  expect(!plan.capacity_error, "fits");

  auto report = run_session(ctx, *volume, plan);
  expect_eq(report.injected, 3u, "injected");
  expect_eq(read_file(fx.mount() / ".settings"), std::string("brightness=7\n"), "hidden update written");
  expect_eq(report.extracted, 1u, "extracted in the same session");
  expect_eq(sha256_file(fx.mount() / "charts" / "area.bin").value_or(""), sha256_hex(pattern_bytes(3000, 3)),
            "nested inject verified");

  auto again = reconciler.identify(fx.mount());
  auto second = plan_ok(reconciler, *again, fx.archive());
  expect(second.empty(), "second pass has nothing to do");
  expect_eq(second.unchanged.size(), 3u, "every update already present, hidden one included");
}

void test_capacity_boundary(TestContext& ctx) {
  const uint64_t need = 6000;
  {
    MediaFixture fx("capacity_exact");
    fx.mark_volume();
    write_file(fx.archive() / "updates" / "nav.db", pattern_bytes(need));
    auto reconciler = make_reconciler(ctx, need);
    auto volume = reconciler.identify(fx.mount());
    auto plan = plan_ok(reconciler, *volume, fx.archive());
    expect(!plan.capacity_error, "exactly enough space is enough");
    auto report = run_session(ctx, *volume, plan);
    expect_eq(report.injected, 1u, "written");
  }
  {
    MediaFixture fx("capacity_short");
    fx.mark_volume();
    write_file(fx.archive() / "updates" / "nav.db", pattern_bytes(need));
    auto reconciler = make_reconciler(ctx, need - 1);
    auto volume = reconciler.identify(fx.mount());
    auto plan = plan_ok(reconciler, *volume, fx.archive());
    expect(plan.capacity_error.has_value(), "one byte short");
    expect(plan.capacity_error->kind == ErrorKind::CapacityExceeded, "capacity error kind");
    expect(reconciler.plan_tasks(plan).empty(), "no inject tasks");

    auto report = run_session(ctx, *volume, plan);
    expect(report.capacity_refused, "refusal reported");
    expect_eq(report.injected, 0u, "nothing written");
    expect(!fs::exists(fx.mount() / "nav.db"), "volume untouched");
  }
}

void test_extract_frees_space_for_injects(TestContext& ctx) {
  MediaFixture fx("capacity_extract");
  fx.mark_volume();
  write_file(fx.mount() / kDemoLog, std::string(4000, 'x'));
  write_file(fx.archive() / "updates" / "nav.db", pattern_bytes(5000));
  auto reconciler = make_reconciler(ctx, 1000);
  auto plan = plan_ok(reconciler, *reconciler.identify(fx.mount()), fx.archive());
  expect(!plan.capacity_error, "extract makes room");
  auto tasks = reconciler.plan_tasks(plan);
  expect_eq(tasks.size(), 2u, "two tasks");
  expect(tasks[0].kind == TaskKind::ExtractFromMedia, "extract runs first");
  expect(tasks[1].kind == TaskKind::CopyToMedia, "inject after");

  auto volume = reconciler.identify(fx.mount());
  auto report = run_session(ctx, *volume, plan);
  expect_eq(report.extracted, 1u, "extracted");
  expect_eq(report.injected, 1u, "injected into the freed space");
  expect(!report.capacity_refused, "not refused");
}

void test_failed_extract_refuses_injects(TestContext& ctx) {
  MediaFixture fx("capacity_extract_fails");
  fx.mark_volume();
  write_file(fx.mount() / kDemoLog, std::string(4000, 'x'));
  write_file(fx.archive() / "updates" / "nav.db", pattern_bytes(5000));
  auto reconciler = make_reconciler(ctx, 1000);
  auto volume = reconciler.identify(fx.mount());
  auto plan = plan_ok(reconciler, *volume, fx.archive());
  expect(!plan.capacity_error, "planned on the extract making room");

  TransferEngine engine(engine_options(), nullptr, ctx.logger);
  auto retry = quick_retry(ctx);
  int inject_runs = 0;
  ReconcileSession session(*volume, plan, [&](TransferTask& task) {
    if(task.kind == TaskKind::ExtractFromMedia) {
      ++task.attempts;
      return Result<TransferOutcome>::Error(make_error(ErrorKind::TransientIo, "card read error",
                                                      task.source.absolute_path.string()));
    }
    ++inject_runs;
    return engine.transfer(task);
  }, retry, 3, ctx.logger);
  auto report = session.run();
  expect_ok(report, "session");
  expect_eq(report.data.extracted, 0u, "extract failed");
  expect_eq(inject_runs, 0, "no inject attempted");
  expect(report.data.capacity_refused, "refusal reported");
  expect(std::any_of(report.data.errors.begin(), report.data.errors.end(),
                     [](const SyncError& e){ return e.kind == ErrorKind::CapacityExceeded; }),
         "capacity error recorded");
  expect(!fs::exists(fx.mount() / "nav.db"), "volume untouched");
  expect(fs::exists(fx.mount() / kDemoLog), "log still on the volume");
}

void test_archive_collisions(TestContext& ctx) {
  MediaFixture fx("collision");
  fx.mark_volume();
  write_file(fx.mount() / kDemoLog, "new flight");
  write_file(fx.archive() / "demo" / kDemoArchiveName, "different flight, same name");

  auto reconciler = make_reconciler(ctx);
  auto volume = reconciler.identify(fx.mount());
  auto plan = plan_ok(reconciler, *volume, fx.archive());
  expect_eq(plan.extracts.size(), 1u, "one extract");
  expect_eq(plan.extracts[0].destination.filename().string(),
            std::string("2024-05-01_DEMO-20240501-143000_1.LOG"), "suffixed");
  expect(!plan.extracts[0].already_archived, "needs a copy");

  run_session(ctx, *volume, plan);
  expect_eq(read_file(fx.archive() / "demo" / kDemoArchiveName), std::string("different flight, same name"),
            "existing archive file untouched");
  expect_eq(read_file(plan.extracts[0].destination), std::string("new flight"), "new file beside it");
}

void test_identical_archive_copy_is_delete_only(TestContext& ctx) {
  MediaFixture fx("already_archived");
  fx.mark_volume();
  write_file(fx.mount() / kDemoLog, "same flight");
  write_file(fx.archive() / "demo" / kDemoArchiveName, "same flight");

  auto reconciler = make_reconciler(ctx);
  auto volume = reconciler.identify(fx.mount());
  auto plan = plan_ok(reconciler, *volume, fx.archive());
  expect(plan.extracts[0].already_archived, "identical copy found");
  expect(plan.extracts[0].destination == fx.archive() / "demo" / kDemoArchiveName, "no suffix");

  auto report = run_session(ctx, *volume, plan);
  expect_eq(report.extracted, 1u, "counted");
  expect(!fs::exists(fx.mount() / kDemoLog), "volume copy removed");
  expect(!fs::exists(fx.archive() / "demo" / "2024-05-01_DEMO-20240501-143000_1.LOG"), "no duplicate");
}

void test_newer_version_on_volume_is_kept(TestContext& ctx) {
  MediaFixture fx("no_downgrade");
  fx.mark_volume();
  write_file(fx.mount() / "nav_v2.5.db", "newer");
  write_file(fx.archive() / "updates" / "nav_v2.4.db", "older");
  write_file(fx.archive() / "updates" / "wx_v1.1.bin", "wx newer");
  write_file(fx.mount() / "wx_v1.0.bin", "wx older");

  auto reconciler = make_reconciler(ctx);
  auto plan = plan_ok(reconciler, *reconciler.identify(fx.mount()), fx.archive());
  expect_eq(plan.injects.size(), 1u, "only the upgrade");
  expect_eq(plan.injects[0].source.relative_path, std::string("wx_v1.1.bin"), "upgrade planned");
  expect(std::find(plan.unchanged.begin(), plan.unchanged.end(), "nav_v2.4.db") != plan.unchanged.end(),
         "downgrade skipped");
  expect(ctx.logs.contains("not replacing"), "skip logged");
}

void test_missing_archive_is_fatal(TestContext& ctx) {
  MediaFixture fx("no_archive");
  fx.mark_volume();
  auto reconciler = make_reconciler(ctx);
  auto volume = reconciler.identify(fx.mount());
  expect_error(reconciler.reconcile(*volume, fx.dir / "missing"), ErrorKind::ArchiveInaccessible, "no archive");
}

void test_volume_removed_mid_session(TestContext& ctx) {
  MediaFixture fx("removed");
  fx.mark_volume();
  write_file(fx.archive() / "updates" / "a.bin", pattern_bytes(100));
  write_file(fx.archive() / "updates" / "b.bin", pattern_bytes(100, 2));
  write_file(fx.archive() / "updates" / "c.bin", pattern_bytes(100, 3));

  auto reconciler = make_reconciler(ctx);
  auto volume = reconciler.identify(fx.mount());
  auto plan = plan_ok(reconciler, *volume, fx.archive());
  expect_eq(plan.injects.size(), 3u, "three injects");

  TransferEngine engine(engine_options(), nullptr, ctx.logger);
  auto retry = quick_retry(ctx);
  int ran = 0;
  ReconcileSession session(*volume, plan, [&](TransferTask& task) {
    if(++ran == 2) fs::remove_all(fx.mount());
    return engine.transfer(task);
  }, retry, 3, ctx.logger);
  auto report = session.run();
  expect_ok(report, "session");
  expect(report.data.aborted, "aborted");
  expect_eq(report.data.injected, 1u, "first one made it");
  expect_eq(report.data.pending, 2u, "rest left for next insertion");
  expect(!report.data.errors.empty() && report.data.errors.back().kind == ErrorKind::VolumeRemoved,
         "volume removal recorded");
}

void test_volume_removal_stops_retries(TestContext& ctx) {
  MediaFixture fx("removed_retry");
  fx.mark_volume();
  write_file(fx.archive() / "updates" / "a.bin", pattern_bytes(100));

  auto reconciler = make_reconciler(ctx);
  auto volume = reconciler.identify(fx.mount());
  auto plan = plan_ok(reconciler, *volume, fx.archive());

  RetryOptions options;
  options.max_attempts = 5;
  options.base_delay = milliseconds(400);
  options.max_delay = milliseconds(400);
  RetryPolicy retry(options, ctx.logger);
  int runs = 0;
  ReconcileSession session(*volume, plan, [&](TransferTask& task) {
    ++runs;
    ++task.attempts;
    fs::remove_all(fx.mount());
    return Result<TransferOutcome>::Error(make_error(ErrorKind::VolumeRemoved, "gone", task.volume_root));
  }, retry, 5, ctx.logger);

  auto started = std::chrono::steady_clock::now();
  auto report = session.run();
  auto elapsed = std::chrono::steady_clock::now() - started;
  expect_ok(report, "session");
  expect_eq(runs, 1, "no retry against a missing volume");
  expect(elapsed < milliseconds(400), "no backoff sleep");
  expect(report.data.aborted, "aborted");
  expect_eq(report.data.pending, 1u, "left for the next insertion");
}

void test_session_lock_contention(TestContext& ctx) {
  MediaFixture fx("lock");
  fx.mark_volume("LOCKED");
  auto reconciler = make_reconciler(ctx);
  auto volume = reconciler.identify(fx.mount());

  VolumeLock held("LOCKED");
  expect(held.owns(), "first holder");
  VolumeLock second("LOCKED");
  expect(!second.owns(), "second holder refused");

  auto retry = quick_retry(ctx);
  ReconcileSession session(*volume, ReconcilePlan{}, [](TransferTask&) {
    return Result<TransferOutcome>::Ok(TransferOutcome{});
  }, retry, 3, ctx.logger);
  expect_error(session.run(), ErrorKind::LockContention, "busy volume");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"pattern_helpers", test_pattern_helpers},
    {"identify_by_markers", test_identify_by_markers},
    {"logical_id_ignores_mount_name", test_logical_id_ignores_mount_name},
    {"plan_extracts_only_matching_files", test_plan_extracts_only_matching_files},
    {"snapshots_and_logbooks_are_extracted", test_snapshots_and_logbooks_are_extracted},
    {"injects_updates_and_is_idempotent", test_injects_updates_and_is_idempotent},
    {"capacity_boundary", test_capacity_boundary},
    {"extract_frees_space_for_injects", test_extract_frees_space_for_injects},
    {"failed_extract_refuses_injects", test_failed_extract_refuses_injects},
    {"archive_collisions", test_archive_collisions},
    {"identical_archive_copy_is_delete_only", test_identical_archive_copy_is_delete_only},
    {"newer_version_on_volume_is_kept", test_newer_version_on_volume_is_kept},
    {"missing_archive_is_fatal", test_missing_archive_is_fatal},
    {"volume_removed_mid_session", test_volume_removed_mid_session},
    {"volume_removal_stops_retries", test_volume_removal_stops_retries},
    {"session_lock_contention", test_session_lock_contention},
  };
  return run_tests("media_reconciler", tests, argc, argv);
}
