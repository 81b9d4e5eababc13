#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "connection_manager.hpp"
#include "errors.hpp"
#include "sync_types.hpp"

class Logger;

struct RemoteAck {
  std::string fingerprint; // as computed by the receiver over the bytes it wrote
  uint64_t bytes = 0;
  bool skipped = false;    // receiver already held identical content
};

// Producer-side view of the other host. Tests substitute scripted transports.
class RemoteTransport {
public:
  virtual ~RemoteTransport() = default;

  virtual Result<void> ping() = 0;
  virtual Result<RemoteAck> push(const FileRecord& source, const std::string& remote_path) = 0;
  // Writes atomically to local_destination; the returned record describes what was written.
  virtual Result<FileRecord> pull(const std::string& remote_path,
                                  const std::filesystem::path& local_destination) = 0;
  virtual Result<std::vector<FileRecord>> manifest() = 0;
};

struct TcpTransportOptions {
  int compression_level = 0; // 0 sends raw frames
  std::size_t chunk_size = 256 * 1024;
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds io_timeout{30000};
  bool sync_writes = true;
};

class TcpTransport : public RemoteTransport {
public:
  TcpTransport(Endpoint endpoint,
               TcpTransportOptions options,
               std::shared_ptr<ConnectionManager> connections = nullptr,
               std::shared_ptr<Logger> logger = nullptr);

  Result<void> ping() override;
  Result<RemoteAck> push(const FileRecord& source, const std::string& remote_path) override;
  Result<FileRecord> pull(const std::string& remote_path,
                          const std::filesystem::path& local_destination) override;
  Result<std::vector<FileRecord>> manifest() override;

  const Endpoint& endpoint() const { return endpoint_; }

private:
  template<typename T>
  Result<T> observe(Result<T> result);

  Endpoint endpoint_;
  TcpTransportOptions options_;
  std::shared_ptr<ConnectionManager> connections_;
  std::shared_ptr<Logger> logger_;
};
