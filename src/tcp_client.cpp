#include "tcp_client.hpp"

#include <algorithm>
#include <cstring>
#include <istream>

#include "log.hpp"

TcpClient::TcpClient(std::chrono::milliseconds io_timeout)
  : socket_(io_), io_timeout_(io_timeout) {}

TcpClient::~TcpClient() {
  close();
}

void TcpClient::close() {
  std::error_code ignored;
  if(socket_.is_open()) {
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }
}

Result<void> TcpClient::run_pending(bool& done, std::chrono::milliseconds timeout, const char* what) {
  io_.restart();
  io_.run_for(timeout);
  if(!done) {
    // cancel the outstanding operation and let its handler observe the abort
    std::error_code ignored;
    socket_.close(ignored);
    io_.restart();
    io_.run();
    return Result<void>::Error(make_error(ErrorKind::NetworkTimeout,
                                          std::string(what) + " timed out"));
  }
  if(last_ec_) {
    auto kind = error_kind_from_error_code(last_ec_);
    auto message = std::string(what) + " failed: " + last_ec_.message();
    close();
    return Result<void>::Error(make_error(kind, message));
  }
  return Result<void>::Ok();
}

Result<void> TcpClient::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
  close();
  read_buf_.consume(read_buf_.size());

  asio::ip::tcp::resolver resolver(io_);
  std::error_code ec;
  auto results = resolver.resolve(host, std::to_string(port), ec);
  if(ec) {
    return Result<void>::Error(make_error(error_kind_from_error_code(ec),
                                          "resolve " + host + " failed: " + ec.message()));
  }

  bool done = false;
  last_ec_.clear();
  asio::async_connect(socket_, results,
    [this, &done](std::error_code ec, const asio::ip::tcp::endpoint&){
      last_ec_ = ec;
      done = true;
    });
  auto result = run_pending(done, timeout, "connect");
  if(result.success) {
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
  }
  return result;
}

Result<void> TcpClient::write_all(const void* data, std::size_t size) {
  if(!socket_.is_open()) {
    return Result<void>::Error(make_error(ErrorKind::ConnectionLost, "socket is closed"));
  }
  bool done = false;
  last_ec_.clear();
  asio::async_write(socket_, asio::buffer(data, size),
    [this, &done](std::error_code ec, std::size_t){
      last_ec_ = ec;
      done = true;
    });
  return run_pending(done, io_timeout_, "write");
}

Result<void> TcpClient::send_json(const nlohmann::json& message) {
  auto line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
  return write_all(line.data(), line.size());
}

Result<nlohmann::json> TcpClient::read_json(std::size_t max_bytes) {
  if(!socket_.is_open()) {
    return Result<nlohmann::json>::Error(make_error(ErrorKind::ConnectionLost, "socket is closed"));
  }
  bool done = false;
  last_ec_.clear();
  asio::async_read_until(socket_, read_buf_, '\n',
    [this, &done](std::error_code ec, std::size_t){
      last_ec_ = ec;
      done = true;
    });
  auto read = run_pending(done, io_timeout_, "read");
  if(!read.success) return Result<nlohmann::json>::Error(read.error);

  std::istream is(&read_buf_);
  std::string line;
  std::getline(is, line);
  if(line.size() > max_bytes) {
    close();
    return Result<nlohmann::json>::Error(make_error(ErrorKind::ProtocolError, "control line too long"));
  }
  try {
    return Result<nlohmann::json>::Ok(nlohmann::json::parse(line));
  } catch(const std::exception& ex) {
    close();
    return Result<nlohmann::json>::Error(make_error(ErrorKind::ProtocolError,
                                                    std::string("malformed message: ") + ex.what()));
  }
}

Result<void> TcpClient::read_exact(void* data, std::size_t size) {
  auto* out = static_cast<char*>(data);
  // bytes that arrived together with the last control line
  std::size_t buffered = std::min(size, read_buf_.size());
  if(buffered > 0) {
    asio::buffer_copy(asio::buffer(out, buffered), read_buf_.data(), buffered);
    read_buf_.consume(buffered);
  }
  if(buffered == size) return Result<void>::Ok();
  if(!socket_.is_open()) {
    return Result<void>::Error(make_error(ErrorKind::ConnectionLost, "socket is closed"));
  }

  bool done = false;
  last_ec_.clear();
  asio::async_read(socket_, asio::buffer(out + buffered, size - buffered),
    [this, &done](std::error_code ec, std::size_t){
      last_ec_ = ec;
      done = true;
    });
  return run_pending(done, io_timeout_, "read");
}
