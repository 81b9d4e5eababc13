#include "transfer_engine.hpp"

#include <cerrno>
#include <vector>

#include "atomic_writer.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

bool volume_present(const std::string& volume_root) {
  if(volume_root.empty()) return true;
  std::error_code ec;
  return std::filesystem::is_directory(volume_root, ec);
}

} // namespace

TransferEngine::TransferEngine(TransferOptions options,
                               std::shared_ptr<RemoteTransport> remote,
                               std::shared_ptr<Logger> logger)
  : options_(options), remote_(std::move(remote)), logger_(std::move(logger)) {
  if(options_.chunk_size == 0) options_.chunk_size = 256 * 1024;
}

Result<TransferOutcome> TransferEngine::transfer(TransferTask& task) {
  ++task.attempts;
  auto start = std::chrono::steady_clock::now();
  auto result = run(task);
  if(result.success) {
    result.data.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
    task.last_error.reset();
    log_debug(logger_.get(), "{} {} -> {}: {} in {} ms{}", to_string(task.kind), task.source.relative_path,
              task.destination, format_size(result.data.bytes), result.data.duration.count(),
              result.data.skipped ? " (already present)" : "");
  } else {
    if(result.error.path.empty()) result.error.path = task.source.relative_path;
    task.last_error = result.error;
    log_debug(logger_.get(), "{} {} attempt {} failed: {}", to_string(task.kind),
              task.source.relative_path, task.attempts, result.error.describe());
  }
  return result;
}

Result<TransferOutcome> TransferEngine::run(const TransferTask& task) {
  switch(task.kind) {
    case TaskKind::Push: return run_push(task);
    case TaskKind::Pull: return run_pull(task);
    case TaskKind::CopyToMedia: return run_copy_to_media(task);
    case TaskKind::ExtractFromMedia: return run_extract(task);
  }
  return Result<TransferOutcome>::Error(make_error(ErrorKind::ProtocolError, "unknown task kind"));
}

Result<TransferOutcome> TransferEngine::run_push(const TransferTask& task) {
  using R = Result<TransferOutcome>;
  if(!remote_) return R::Error(make_error(ErrorKind::ConfigInvalid, "no endpoint configured for push"));
  auto ack = remote_->push(task.source, task.destination);
  if(!ack.success) return R::Error(ack.error);
  TransferOutcome outcome;
  outcome.bytes = ack.data.bytes;
  outcome.fingerprint = ack.data.fingerprint;
  outcome.skipped = ack.data.skipped;
  return R::Ok(std::move(outcome));
}

Result<TransferOutcome> TransferEngine::run_pull(const TransferTask& task) {
  using R = Result<TransferOutcome>;
  if(!remote_) return R::Error(make_error(ErrorKind::ConfigInvalid, "no endpoint configured for pull"));
  auto pulled = remote_->pull(task.source.relative_path, task.destination);
  if(!pulled.success) return R::Error(pulled.error);
  TransferOutcome outcome;
  outcome.bytes = pulled.data.size;
  outcome.fingerprint = pulled.data.fingerprint;
  return R::Ok(std::move(outcome));
}

Result<TransferOutcome> TransferEngine::copy_local(const FileRecord& source,
                                                   const std::filesystem::path& destination,
                                                   bool readback) {
  using R = Result<TransferOutcome>;
  FileReader reader;
  auto opened = reader.open(source.absolute_path);
  if(!opened.success) return R::Error(opened.error);

  AtomicFileWriter writer;
  auto created = writer.open(destination);
  if(!created.success) return R::Error(created.error);

  std::vector<char> buffer(options_.chunk_size);
  while(true) {
    auto got = reader.read(buffer.data(), buffer.size());
    if(!got.success) {
      writer.abort();
      return R::Error(got.error);
    }
    if(got.data == 0) break;
    auto wrote = writer.write(buffer.data(), got.data);
    if(!wrote.success) return R::Error(wrote.error);
  }
  reader.close();

  auto committed = writer.commit(source.fingerprint, options_.sync_writes);
  if(!committed.success) return R::Error(committed.error);

  TransferOutcome outcome;
  outcome.bytes = writer.bytes_written();
  outcome.fingerprint = writer.fingerprint();

  if(readback) {
    auto landed = sha256_file(destination);
    if(!landed) {
      return R::Error(make_error(ErrorKind::TransientIo, "cannot read back written file", destination.string()));
    }
    if(*landed != source.fingerprint) {
      std::error_code ignored;
      std::filesystem::remove(destination, ignored);
      return R::Error(make_error(ErrorKind::ReadbackMismatch,
                                 "read back " + *landed + ", expected " + source.fingerprint,
                                 destination.string()));
    }
  }
  return R::Ok(std::move(outcome));
}

SyncError TransferEngine::media_error(const TransferTask& task, SyncError error) const {
  if(!volume_present(task.volume_root)) {
    error.message = "volume removed (" + error.message + ")";
    error.kind = ErrorKind::VolumeRemoved;
  }
  return error;
}

Result<TransferOutcome> TransferEngine::run_copy_to_media(const TransferTask& task) {
  using R = Result<TransferOutcome>;
  if(!volume_present(task.volume_root)) {
    return R::Error(make_error(ErrorKind::VolumeRemoved, "volume is gone", task.volume_root));
  }
  auto copied = copy_local(task.source, task.destination, options_.readback_verify);
  if(!copied.success) return R::Error(media_error(task, copied.error));
  return copied;
}

Result<TransferOutcome> TransferEngine::run_extract(const TransferTask& task) {
  using R = Result<TransferOutcome>;
  if(!volume_present(task.volume_root)) {
    return R::Error(make_error(ErrorKind::VolumeRemoved, "volume is gone", task.volume_root));
  }

  TransferOutcome outcome;
  const std::filesystem::path destination = task.destination;
  auto existing = stat_path(destination);
  auto current = existing && existing->regular ? sha256_file(destination) : std::nullopt;
  if(current && *current == task.source.fingerprint) {
    // archive already has it, only the volume copy remains to be removed
    outcome.fingerprint = *current;
    outcome.skipped = true;
  } else {
    // archive copies are verified by reading them back before the source goes away
    auto copied = copy_local(task.source, destination, true);
    if(!copied.success) return R::Error(media_error(task, copied.error));
    outcome = copied.data;
  }

  std::error_code ec;
  std::filesystem::remove(task.source.absolute_path, ec);
  if(ec && ec != std::errc::no_such_file_or_directory) {
    return R::Error(media_error(task, make_errno_error(ec.value(), "cannot remove extracted file from volume",
                                                       task.source.absolute_path.string())));
  }
  return R::Ok(std::move(outcome));
}
