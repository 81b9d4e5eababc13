#include "atomic_writer.hpp"
#include "remote_transport.hpp"
#include "test_runner_utils.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace efsync::test;
namespace fs = std::filesystem;

namespace {

FileRecord record_for(const fs::path& path, const std::string& relative) {
  FileRecord record;
  record.relative_path = relative;
  record.absolute_path = path;
  auto content = read_file(path);
  record.size = content.size();
  record.fingerprint = sha256_hex(content);
  return record;
}

TransferOptions small_chunks() {
  TransferOptions options;
  options.chunk_size = 4096;
  options.sync_writes = false;
  return options;
}

std::vector<std::string> temp_leftovers(const fs::path& dir) {
  std::vector<std::string> out;
  std::error_code ec;
  for(const auto& entry : fs::recursive_directory_iterator(dir, ec)) {
    if(AtomicFileWriter::is_temp_name(entry.path().filename().string())) {
      out.push_back(entry.path().string());
    }
  }
  return out;
}

// Replays scripted outcomes; falls back to success once the script runs out.
class ScriptedTransport : public RemoteTransport {
public:
  std::deque<SyncError> push_failures;
  std::vector<std::string> pushed;

  Result<void> ping() override { return Result<void>::Ok(); }

  Result<RemoteAck> push(const FileRecord& source, const std::string& remote_path) override {
    if(!push_failures.empty()) {
      auto error = push_failures.front();
      push_failures.pop_front();
      return Result<RemoteAck>::Error(error);
    }
    pushed.push_back(remote_path);
    RemoteAck ack;
    ack.bytes = source.size;
    ack.fingerprint = source.fingerprint;
    return Result<RemoteAck>::Ok(ack);
  }

  Result<FileRecord> pull(const std::string& remote_path, const fs::path& local_destination) override {
    write_file(local_destination, "pulled:" + remote_path);
    return Result<FileRecord>::Ok(record_for(local_destination, remote_path));
  }

  Result<std::vector<FileRecord>> manifest() override {
    return Result<std::vector<FileRecord>>::Ok({});
  }
};

void test_copy_local_is_verified_and_atomic(TestContext& ctx) {
  TempDir dir("copy_local");
  auto payload = pattern_bytes(3 * 4096 + 123);
  write_file(dir / "src" / "data.bin", payload);
  auto source = record_for(dir / "src" / "data.bin", "data.bin");

  TransferEngine engine(small_chunks(), nullptr, ctx.logger);
  auto dest = dir / "dst" / "nested" / "data.bin";
  auto result = engine.copy_local(source, dest, true);
  expect_ok(result, "copy");
  expect_eq(result.data.bytes, payload.size(), "bytes");
  expect_eq(result.data.fingerprint, source.fingerprint, "fingerprint");
  expect(read_file(dest) == payload, "content matches");
  expect(temp_leftovers(dir / "dst").empty(), "no temporary files left");
}

void test_copy_replaces_existing_destination(TestContext& ctx) {
  TempDir dir("copy_replace");
  write_file(dir / "new.txt", "new content");
  write_file(dir / "dst" / "file.txt", "old content that is longer");
  TransferEngine engine(small_chunks(), nullptr, ctx.logger);
  expect_ok(engine.copy_local(record_for(dir / "new.txt", "file.txt"), dir / "dst" / "file.txt", false), "copy");
  expect_eq(read_file(dir / "dst" / "file.txt"), std::string("new content"), "replaced whole");
}

void test_checksum_mismatch_leaves_destination_untouched(TestContext& ctx) {
  TempDir dir("copy_mismatch");
  write_file(dir / "src.txt", "modified after the scan");
  write_file(dir / "dst" / "src.txt", "previous good copy");
  auto stale = record_for(dir / "src.txt", "src.txt");
  stale.fingerprint = sha256_hex("what the scan saw");

  TransferEngine engine(small_chunks(), nullptr, ctx.logger);
  auto result = engine.copy_local(stale, dir / "dst" / "src.txt", true);
  expect_error(result, ErrorKind::ChecksumMismatch, "streamed hash differs");
  expect(result.error.retryable(), "mismatch is retryable");
  expect_eq(read_file(dir / "dst" / "src.txt"), std::string("previous good copy"), "old copy kept");
  expect(temp_leftovers(dir / "dst").empty(), "temporary removed");
}

void test_missing_source(TestContext& ctx) {
  TempDir dir("copy_missing");
  FileRecord ghost;
  ghost.relative_path = "ghost.txt";
  ghost.absolute_path = dir / "ghost.txt";
  ghost.fingerprint = sha256_hex("x");
  TransferEngine engine(small_chunks(), nullptr, ctx.logger);
  auto result = engine.copy_local(ghost, dir / "out" / "ghost.txt", false);
  expect_error(result, ErrorKind::SourceMissing, "missing source");
  expect(!fs::exists(dir / "out" / "ghost.txt"), "nothing written");
}

void test_transfer_counts_attempts(TestContext& ctx) {
  TempDir dir("transfer_attempts");
  write_file(dir / "a.log", "alpha");
  auto remote = std::make_shared<ScriptedTransport>();
  remote->push_failures.push_back(make_error(ErrorKind::ConnectionLost, "reset"));
  TransferEngine engine(small_chunks(), remote, ctx.logger);

  TransferTask task;
  task.kind = TaskKind::Push;
  task.source = record_for(dir / "a.log", "a.log");
  task.destination = "a.log";

  auto first = engine.transfer(task);
  expect_error(first, ErrorKind::ConnectionLost, "first push fails");
  expect_eq(task.attempts, 1u, "attempt counted");
  expect(task.last_error && task.last_error->kind == ErrorKind::ConnectionLost, "error recorded on task");
  expect_eq(task.last_error->path, std::string("a.log"), "path filled in");

  auto second = engine.transfer(task);
  expect_ok(second, "second push");
  expect_eq(task.attempts, 2u, "second attempt");
  expect(!task.last_error, "error cleared on success");
  expect_eq(second.data.bytes, 5u, "bytes from ack");
  expect(remote->pushed == std::vector<std::string>({"a.log"}), "pushed once");
}

void test_push_without_remote(TestContext& ctx) {
  TransferEngine engine(small_chunks(), nullptr, ctx.logger);
  TransferTask task;
  task.kind = TaskKind::Push;
  task.source.relative_path = "a.log";
  expect_error(engine.transfer(task), ErrorKind::ConfigInvalid, "no endpoint");
}

void test_pull_writes_destination(TestContext& ctx) {
  TempDir dir("transfer_pull");
  auto remote = std::make_shared<ScriptedTransport>();
  TransferEngine engine(small_chunks(), remote, ctx.logger);
  TransferTask task;
  task.kind = TaskKind::Pull;
  task.source.relative_path = "logs/b.log";
  task.destination = (dir / "local" / "logs" / "b.log").string();
  auto result = engine.transfer(task);
  expect_ok(result, "pull");
  expect_eq(read_file(dir / "local" / "logs" / "b.log"), std::string("pulled:logs/b.log"), "content");
}

void test_copy_to_media(TestContext& ctx) {
  TempDir dir("copy_media");
  write_file(dir / "archive" / "updates" / "nav_v2.db", pattern_bytes(10000));
  fs::create_directories(dir / "volume");

  TransferEngine engine(small_chunks(), nullptr, ctx.logger);
  TransferTask task;
  task.kind = TaskKind::CopyToMedia;
  task.source = record_for(dir / "archive" / "updates" / "nav_v2.db", "nav_v2.db");
  task.destination = (dir / "volume" / "nav_v2.db").string();
  task.volume_root = (dir / "volume").string();
  auto result = engine.transfer(task);
  expect_ok(result, "copy to media");
  expect_eq(sha256_file(dir / "volume" / "nav_v2.db").value_or(""), task.source.fingerprint, "verified on media");
}

void test_copy_to_removed_volume(TestContext& ctx) {
  TempDir dir("copy_media_gone");
  write_file(dir / "archive" / "nav.db", "nav");
  TransferEngine engine(small_chunks(), nullptr, ctx.logger);
  TransferTask task;
  task.kind = TaskKind::CopyToMedia;
  task.source = record_for(dir / "archive" / "nav.db", "nav.db");
  task.destination = (dir / "volume" / "nav.db").string();
  task.volume_root = (dir / "volume").string();
  auto result = engine.transfer(task);
  expect_error(result, ErrorKind::VolumeRemoved, "volume missing");
  expect(!fs::exists(dir / "volume"), "nothing created where the volume was");
}

void test_extract_moves_file_off_volume(TestContext& ctx) {
  TempDir dir("extract");
  write_file(dir / "volume" / "logbook" / "flight1.csv", "t,alt\n0,100\n");
  TransferEngine engine(small_chunks(), nullptr, ctx.logger);

  TransferTask task;
  task.kind = TaskKind::ExtractFromMedia;
  task.source = record_for(dir / "volume" / "logbook" / "flight1.csv", "logbook/flight1.csv");
  task.destination = (dir / "archive" / "logbook" / "flight1.csv").string();
  task.volume_root = (dir / "volume").string();
  auto result = engine.transfer(task);
  expect_ok(result, "extract");
  expect(!result.data.skipped, "real copy");
  expect_eq(read_file(dir / "archive" / "logbook" / "flight1.csv"), std::string("t,alt\n0,100\n"), "archived");
  expect(!fs::exists(dir / "volume" / "logbook" / "flight1.csv"), "removed from the volume");
}

void test_extract_with_identical_archive_copy_only_deletes(TestContext& ctx) {
  TempDir dir("extract_dup");
  write_file(dir / "volume" / "a.csv", "same");
  write_file(dir / "archive" / "a.csv", "same");
  auto before = fs::last_write_time(dir / "archive" / "a.csv");

  TransferEngine engine(small_chunks(), nullptr, ctx.logger);
  TransferTask task;
  task.kind = TaskKind::ExtractFromMedia;
  task.source = record_for(dir / "volume" / "a.csv", "a.csv");
  task.destination = (dir / "archive" / "a.csv").string();
  task.volume_root = (dir / "volume").string();
  auto result = engine.transfer(task);
  expect_ok(result, "extract");
  expect(result.data.skipped, "archive already had it");
  expect(fs::last_write_time(dir / "archive" / "a.csv") == before, "archive copy untouched");
  expect(!fs::exists(dir / "volume" / "a.csv"), "volume copy removed");
}

void test_orphan_cleanup(TestContext& ctx) {
  TempDir dir("orphans");
  auto orphan = dir / "sub" / (std::string(kTempPrefix) + "1-1-file.bin" + kTempSuffix);
  write_file(orphan, "half");
  write_file(dir / "sub" / "real.bin", "keep");
  fs::last_write_time(orphan, fs::last_write_time(orphan) - std::chrono::hours(2));

  expect_eq(AtomicFileWriter::cleanup_orphans(dir.path(), std::chrono::seconds(3600), ctx.logger.get()), 1u,
            "one orphan removed");
  expect(!fs::exists(orphan), "orphan gone");
  expect(fs::exists(dir / "sub" / "real.bin"), "real file kept");

  auto fresh = dir / (std::string(kTempPrefix) + "2-2-new.bin" + kTempSuffix);
  write_file(fresh, "in progress");
  expect_eq(AtomicFileWriter::cleanup_orphans(dir.path(), std::chrono::seconds(3600), ctx.logger.get()), 0u,
            "recent temporary kept");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"copy_local_is_verified_and_atomic", test_copy_local_is_verified_and_atomic},
    {"copy_replaces_existing_destination", test_copy_replaces_existing_destination},
    {"checksum_mismatch_leaves_destination_untouched", test_checksum_mismatch_leaves_destination_untouched},
    {"missing_source", test_missing_source},
    {"transfer_counts_attempts", test_transfer_counts_attempts},
    {"push_without_remote", test_push_without_remote},
    {"pull_writes_destination", test_pull_writes_destination},
    {"copy_to_media", test_copy_to_media},
    {"copy_to_removed_volume", test_copy_to_removed_volume},
    {"extract_moves_file_off_volume", test_extract_moves_file_off_volume},
    {"extract_with_identical_archive_copy_only_deletes", test_extract_with_identical_archive_copy_only_deletes},
    {"orphan_cleanup", test_orphan_cleanup},
  };
  return run_tests("transfer_engine", tests, argc, argv);
}
