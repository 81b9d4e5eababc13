#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "errors.hpp"
#include "remote_transport.hpp"
#include "sync_types.hpp"

class Logger;

struct TransferOptions {
  std::size_t chunk_size = 256 * 1024;
  bool readback_verify = true; // re-read what landed on removable media
  bool sync_writes = true;
};

struct TransferOutcome {
  uint64_t bytes = 0;
  std::string fingerprint;
  std::chrono::milliseconds duration{0};
  bool skipped = false; // destination already held identical content
};

// Executes one task. Every write goes through a temporary file that is renamed
// into place only after the streamed fingerprint matches the source record.
class TransferEngine {
public:
  TransferEngine(TransferOptions options,
                 std::shared_ptr<RemoteTransport> remote = nullptr,
                 std::shared_ptr<Logger> logger = nullptr);

  // Counts the attempt and records the error on the task.
  Result<TransferOutcome> transfer(TransferTask& task);

  // Chunked verified copy between two local paths.
  Result<TransferOutcome> copy_local(const FileRecord& source,
                                     const std::filesystem::path& destination,
                                     bool readback);

  void set_remote(std::shared_ptr<RemoteTransport> remote) { remote_ = std::move(remote); }
  const TransferOptions& options() const { return options_; }

private:
  Result<TransferOutcome> run(const TransferTask& task);
  Result<TransferOutcome> run_push(const TransferTask& task);
  Result<TransferOutcome> run_pull(const TransferTask& task);
  Result<TransferOutcome> run_copy_to_media(const TransferTask& task);
  Result<TransferOutcome> run_extract(const TransferTask& task);

  // Rewrites device errors as VolumeRemoved once the volume root is gone.
  SyncError media_error(const TransferTask& task, SyncError error) const;

  TransferOptions options_;
  std::shared_ptr<RemoteTransport> remote_;
  std::shared_ptr<Logger> logger_;
};
