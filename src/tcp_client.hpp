#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "errors.hpp"

// Blocking request/response client. Every operation runs the private io_context
// for at most the configured timeout and closes the socket when it expires.
class TcpClient {
public:
  explicit TcpClient(std::chrono::milliseconds io_timeout = std::chrono::seconds(30));
  ~TcpClient();

  TcpClient(const TcpClient&) = delete;
  TcpClient& operator=(const TcpClient&) = delete;

  Result<void> connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
  Result<void> write_all(const void* data, std::size_t size);
  Result<void> send_json(const nlohmann::json& message);
  Result<nlohmann::json> read_json(std::size_t max_bytes);
  Result<void> read_exact(void* data, std::size_t size);

  void close();
  bool is_open() const { return socket_.is_open(); }

private:
  Result<void> run_pending(bool& done, std::chrono::milliseconds timeout, const char* what);

  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  asio::streambuf read_buf_;
  std::chrono::milliseconds io_timeout_;
  std::error_code last_ec_;
};
