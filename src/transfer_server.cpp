#include "transfer_server.hpp"

#include <algorithm>
#include <deque>
#include <istream>
#include <limits>
#include <optional>

#include "atomic_writer.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "utils.hpp"
#include "zstd_codec.hpp"

std::vector<FileRecord> TransferServerContext::manifest() {
  std::lock_guard<std::mutex> lock(manifest_mutex);
  if(!detector) {
    ScanOptions scan;
    scan.exclude_patterns = options.exclude_patterns;
    scan.stability_delay = std::chrono::milliseconds(0);
    detector = std::make_unique<ChangeDetector>(std::make_shared<FileIndex>(), scan, logger);
  }
  return detector->full_manifest(options.root);
}

class TransferSession : public std::enable_shared_from_this<TransferSession> {
public:
  TransferSession(asio::ip::tcp::socket socket, std::shared_ptr<TransferServerContext> context)
    : socket_(std::move(socket)),
      idle_timer_(socket_.get_executor()),
      context_(std::move(context)),
      read_buf_(kMaxControlLine + kMaxFrameSize) {}

  void start() {
    std::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    if(!ec) {
      log_debug(context_->logger.get(), "transfer session from {}", remote.address().to_string());
    }
    do_read_line();
  }

  void close() {
    if(closed_) return;
    closed_ = true;
    idle_timer_.cancel();
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    writer_.abort();
    pull_reader_.close();
    pull_active_ = false;
  }

private:
  Logger* logger() const { return context_->logger.get(); }

  void arm_idle_timer() {
    if(closed_) return;
    idle_timer_.expires_after(context_->options.idle_timeout);
    auto self = shared_from_this();
    idle_timer_.async_wait([this, self](std::error_code ec){
      if(ec) return;
      log_debug(logger(), "closing idle transfer session");
      close();
    });
  }

  void do_read_line() {
    if(closed_) return;
    arm_idle_timer();
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, '\n',
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          if(ec != asio::error::eof && ec != asio::error::operation_aborted) {
            log_debug(logger(), "transfer session read error: {}", ec.message());
          }
          close();
          return;
        }
        std::istream is(&read_buf_);
        std::string line;
        std::getline(is, line);
        if(line.empty()) {
          do_read_line();
          return;
        }
        handle_line(line);
      });
  }

  void handle_line(const std::string& line) {
    json message;
    try {
      message = json::parse(line);
    } catch(const std::exception& ex) {
      log_warn(logger(), "transfer session: malformed message: {}", ex.what());
      async_send_json(make_error_message(make_error(ErrorKind::ProtocolError, "malformed message")));
      do_read_line();
      return;
    }
    const auto type = message.value("type", std::string());
    if(type == "ping") {
      async_send_json(make_pong());
      do_read_line();
    } else if(type == "manifest") {
      async_send_json(make_manifest_result(context_->manifest()));
      do_read_line();
    } else if(type == "push") {
      handle_push(message);
    } else if(type == "pull") {
      handle_pull(message);
    } else {
      log_info(logger(), "Unknown message type: {}", type);
      async_send_json(make_error_message(make_error(ErrorKind::ProtocolError, "unknown message type " + type)));
      do_read_line();
    }
  }

  std::optional<std::filesystem::path> resolve(const std::string& candidate, SyncError& error) const {
    auto relative = safe_relative_path(candidate);
    if(!relative) {
      error = make_error(ErrorKind::ProtocolError, "path escapes the serve root", candidate);
      return std::nullopt;
    }
    return context_->options.root / std::filesystem::path(*relative);
  }

  void reject(const SyncError& error) {
    log_debug(logger(), "transfer session: rejecting request: {}", error.describe());
    async_send_json(make_error_message(error));
    do_read_line();
  }

  void handle_push(const json& message) {
    push_path_ = message.value("path", std::string());
    push_fingerprint_ = message.value("fingerprint", std::string());
    push_compressed_ = message.value("compression", std::string(kCompressionNone)) == kCompressionZstd;
    const auto size = message.value("size", uint64_t{0});
    push_error_.reset();

    SyncError error;
    auto target = resolve(push_path_, error);
    if(!target) {
      reject(error);
      return;
    }

    auto existing = stat_path(*target);
    if(existing && existing->regular && existing->size == size) {
      auto current = sha256_file(*target);
      if(current && *current == push_fingerprint_) {
        async_send_json(make_push_result(*current, 0, true));
        do_read_line();
        return;
      }
    }

    auto available = context_->free_space(context_->options.root);
    if(available < size) {
      reject(make_error(ErrorKind::DestinationFull,
                        "need " + format_size(size) + ", " + format_size(available) + " available",
                        push_path_));
      return;
    }

    auto opened = writer_.open(*target);
    if(!opened.success) {
      reject(opened.error);
      return;
    }
    async_send_json(make_push_ready());
    read_frame();
  }

  void ensure_buffered(std::size_t needed, std::function<void()> next) {
    if(closed_) return;
    if(read_buf_.size() >= needed) {
      next();
      return;
    }
    arm_idle_timer();
    auto self = shared_from_this();
    asio::async_read(socket_, read_buf_, asio::transfer_exactly(needed - read_buf_.size()),
      [this, self, next](std::error_code ec, std::size_t){
        if(ec) {
          log_debug(logger(), "transfer session: body interrupted: {}", ec.message());
          close();
          return;
        }
        next();
      });
  }

  void read_frame() {
    ensure_buffered(kFrameHeaderSize, [this]{
      unsigned char header[kFrameHeaderSize];
      asio::buffer_copy(asio::buffer(header), read_buf_.data(), kFrameHeaderSize);
      read_buf_.consume(kFrameHeaderSize);
      const auto length = decode_frame_length(header);
      if(length == 0) {
        finish_push();
        return;
      }
      if(length > kMaxFrameSize) {
        log_warn(logger(), "transfer session: oversized frame ({} bytes), closing", length);
        close();
        return;
      }
      ensure_buffered(length, [this, length]{
        std::string payload(length, '\0');
        asio::buffer_copy(asio::buffer(payload), read_buf_.data(), length);
        read_buf_.consume(length);
        handle_frame(std::move(payload));
        read_frame();
      });
    });
  }

  void handle_frame(std::string payload) {
    // after a failure the rest of the body is drained so the error reaches the client
    if(push_error_) return;
    if(push_compressed_) {
      auto raw = zstd_decompress_frame(payload.data(), payload.size(), kMaxFrameSize);
      if(!raw.success) {
        push_error_ = raw.error;
        writer_.abort();
        return;
      }
      payload = std::move(raw.data);
    }
    auto wrote = writer_.write(payload.data(), payload.size());
    if(!wrote.success) push_error_ = wrote.error;
  }

  void finish_push() {
    if(push_error_) {
      writer_.abort();
      push_error_->path = push_path_;
      reject(*push_error_);
      return;
    }
    auto committed = writer_.commit(push_fingerprint_, context_->options.sync_writes);
    if(!committed.success) {
      reject(committed.error);
      return;
    }
    log_info(logger(), "received {} ({})", push_path_, format_size(writer_.bytes_written()));
    async_send_json(make_push_result(writer_.fingerprint(), writer_.bytes_written(), false));
    do_read_line();
  }

  void handle_pull(const json& message) {
    const auto path = message.value("path", std::string());
    SyncError error;
    auto target = resolve(path, error);
    if(!target) {
      reject(error);
      return;
    }
    auto st = stat_path(*target);
    if(!st || !st->regular) {
      reject(make_error(ErrorKind::SourceMissing, "no such file", path));
      return;
    }
    auto fingerprint = sha256_file(*target);
    if(!fingerprint) {
      reject(make_error(ErrorKind::SourceUnreadable, "cannot hash file", path));
      return;
    }
    auto opened = pull_reader_.open(*target);
    if(!opened.success) {
      opened.error.path = path;
      reject(opened.error);
      return;
    }

    FileRecord record;
    record.relative_path = path;
    record.size = st->size;
    record.fingerprint = *fingerprint;
    record.mtime_ns = st->mtime_ns;
    pull_compressed_ = message.value("compression", std::string(kCompressionNone)) == kCompressionZstd;
    pull_active_ = true;
    async_send_json(make_pull_header(record, pull_compressed_));
    pump_pull();
    do_read_line();
  }

  // Queues one frame; the next one is produced when the write queue drains.
  void pump_pull() {
    if(!pull_active_ || closed_) return;
    std::string payload(context_->options.chunk_size, '\0');
    auto got = pull_reader_.read(payload.data(), payload.size());
    if(!got.success) {
      log_warn(logger(), "transfer session: pull aborted: {}", got.error.describe());
      close();
      return;
    }
    payload.resize(got.data);
    if(got.data == 0) {
      pull_active_ = false;
      pull_reader_.close();
    } else if(pull_compressed_) {
      auto packed = zstd_compress_frame(payload.data(), payload.size(), context_->options.compression_level);
      if(!packed.success) {
        log_warn(logger(), "transfer session: pull aborted: {}", packed.error.describe());
        close();
        return;
      }
      payload = std::move(packed.data);
    }
    unsigned char header[kFrameHeaderSize];
    encode_frame_length(static_cast<uint32_t>(payload.size()), header);
    std::string frame(reinterpret_cast<const char*>(header), kFrameHeaderSize);
    frame += payload;
    queue_write(std::move(frame));
  }

  void async_send_json(const json& message) {
    queue_write(message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n");
  }

  void queue_write(std::string data) {
    if(closed_) return;
    bool start_write = write_queue_.empty();
    write_queue_.push_back(std::move(data));
    if(start_write) do_write();
  }

  void do_write() {
    if(write_queue_.empty() || closed_) return;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          log_debug(logger(), "transfer session write error: {}", ec.message());
          close();
          return;
        }
        write_queue_.pop_front();
        if(!write_queue_.empty()) {
          do_write();
        } else if(pull_active_) {
          arm_idle_timer();
          pump_pull();
        }
      });
  }

  asio::ip::tcp::socket socket_;
  asio::steady_timer idle_timer_;
  std::shared_ptr<TransferServerContext> context_;
  asio::streambuf read_buf_;
  std::deque<std::string> write_queue_;
  bool closed_ = false;

  AtomicFileWriter writer_;
  std::string push_path_;
  std::string push_fingerprint_;
  bool push_compressed_ = false;
  std::optional<SyncError> push_error_;

  FileReader pull_reader_;
  bool pull_active_ = false;
  bool pull_compressed_ = false;
};

TransferServer::TransferServer(asio::io_context& io, TransferServerOptions options, std::shared_ptr<Logger> logger)
  : io_(io),
    acceptor_(io),
    context_(std::make_shared<TransferServerContext>()) {
  context_->options = std::move(options);
  context_->logger = std::move(logger);
  if(context_->options.chunk_size == 0 || context_->options.chunk_size > kMaxFrameSize / 2) {
    context_->options.chunk_size = 256 * 1024;
  }
  context_->options.exclude_patterns.push_back(std::string(kTempPrefix) + "*");
  context_->free_space = [](const std::filesystem::path& root) -> uint64_t {
    std::error_code ec;
    auto info = std::filesystem::space(root, ec);
    if(ec) return std::numeric_limits<uint64_t>::max();
    return info.available;
  };
}

TransferServer::~TransferServer() {
  std::error_code ignored;
  acceptor_.close(ignored);
}

void TransferServer::set_free_space_probe(std::function<uint64_t(const std::filesystem::path&)> probe) {
  if(probe) context_->free_space = std::move(probe);
}

void TransferServer::start() {
  const auto& options = context_->options;
  std::error_code ec;
  std::filesystem::create_directories(options.root, ec);
  if(ec) {
    throw ConfigError("cannot create serve root " + options.root.string() + ": " + ec.message());
  }
  auto address = asio::ip::make_address(options.listen_ip, ec);
  if(ec) {
    throw ConfigError("invalid listen address " + options.listen_ip + ": " + ec.message());
  }
  asio::ip::tcp::endpoint endpoint(address, options.port);
  acceptor_.open(endpoint.protocol(), ec);
  if(!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_.bind(endpoint, ec);
  if(!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    throw ConfigError("cannot listen on " + options.listen_ip + ":" + std::to_string(options.port) + ": " + ec.message());
  }
  bound_port_ = acceptor_.local_endpoint().port();
  running_ = true;
  log_info(context_->logger.get(), "transfer server listening on {}:{} serving {}",
           options.listen_ip, bound_port_, options.root.string());
  do_accept();
}

void TransferServer::stop() {
  asio::post(io_, [this]{
    if(!running_) return;
    running_ = false;
    std::error_code ignored;
    acceptor_.close(ignored);
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for(auto& weak : sessions_) {
      if(auto session = weak.lock()) session->close();
    }
    sessions_.clear();
  });
}

void TransferServer::do_accept() {
  acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket sock){
    if(ec) {
      if(ec == asio::error::operation_aborted) return;
      log_error(context_->logger.get(), "accept failed: {}", ec.message());
    } else {
      auto session = std::make_shared<TransferSession>(std::move(sock), context_);
      {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<TransferSession>& w){ return w.expired(); }),
                        sessions_.end());
        sessions_.push_back(session);
      }
      session->start();
    }
    if(acceptor_.is_open()) do_accept();
  });
}
