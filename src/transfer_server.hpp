#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "change_detector.hpp"
#include "errors.hpp"

class Logger;
class TransferSession;

struct TransferServerOptions {
  std::filesystem::path root;
  std::string listen_ip = "0.0.0.0";
  uint16_t port = 0; // 0 picks an ephemeral port
  std::size_t chunk_size = 256 * 1024;
  int compression_level = 3; // used when a client asks for compressed bodies
  bool sync_writes = true;
  std::chrono::milliseconds idle_timeout{60000};
  std::vector<std::string> exclude_patterns;
};

// State shared between the server and its sessions. Sessions keep it alive
// on their own so handlers never reach into a destroyed server.
struct TransferServerContext {
  TransferServerOptions options;
  std::shared_ptr<Logger> logger;
  std::mutex manifest_mutex;
  std::unique_ptr<ChangeDetector> detector;
  // Free bytes at the serve root; replaced in tests.
  std::function<uint64_t(const std::filesystem::path&)> free_space;

  std::vector<FileRecord> manifest();
};

// Consumer side of the network relationship. Accepts pushes into the serve
// root through the atomic writer, answers manifests and streams pulls.
class TransferServer {
public:
  TransferServer(asio::io_context& io, TransferServerOptions options, std::shared_ptr<Logger> logger = nullptr);
  ~TransferServer();

  // Binds and starts accepting. Throws ConfigError when the socket cannot be bound.
  void start();
  void stop();
  uint16_t port() const { return bound_port_; }

  void set_free_space_probe(std::function<uint64_t(const std::filesystem::path&)> probe);

private:
  void do_accept();

  asio::io_context& io_;
  asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<TransferServerContext> context_;
  std::mutex sessions_mutex_;
  std::vector<std::weak_ptr<TransferSession>> sessions_;
  uint16_t bound_port_ = 0;
  bool running_ = false;
};
