#include "remote_transport.hpp"

#include <vector>

#include "atomic_writer.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "tcp_client.hpp"
#include "utils.hpp"
#include "zstd_codec.hpp"

namespace {

bool is_network_kind(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::NetworkTimeout:
    case ErrorKind::ConnectionRefused:
    case ErrorKind::ConnectionLost:
    case ErrorKind::EndpointUnreachable:
      return true;
    default:
      return false;
  }
}

Result<void> send_frame(TcpClient& client, const std::string& payload) {
  unsigned char header[kFrameHeaderSize];
  encode_frame_length(static_cast<uint32_t>(payload.size()), header);
  auto wrote = client.write_all(header, sizeof(header));
  if(!wrote.success) return wrote;
  if(payload.empty()) return wrote;
  return client.write_all(payload.data(), payload.size());
}

// Empty payload marks the end of the body.
Result<std::string> read_frame(TcpClient& client) {
  unsigned char header[kFrameHeaderSize];
  auto got = client.read_exact(header, sizeof(header));
  if(!got.success) return Result<std::string>::Error(got.error);
  auto length = decode_frame_length(header);
  if(length > kMaxFrameSize) {
    client.close();
    return Result<std::string>::Error(make_error(ErrorKind::ProtocolError,
                                                 "frame of " + std::to_string(length) + " bytes exceeds limit"));
  }
  std::string payload(length, '\0');
  if(length > 0) {
    got = client.read_exact(payload.data(), payload.size());
    if(!got.success) return Result<std::string>::Error(got.error);
  }
  return Result<std::string>::Ok(std::move(payload));
}

} // namespace

TcpTransport::TcpTransport(Endpoint endpoint,
                           TcpTransportOptions options,
                           std::shared_ptr<ConnectionManager> connections,
                           std::shared_ptr<Logger> logger)
  : endpoint_(std::move(endpoint)),
    options_(options),
    connections_(std::move(connections)),
    logger_(std::move(logger)) {
  if(options_.chunk_size == 0) options_.chunk_size = 256 * 1024;
  if(options_.chunk_size > kMaxFrameSize / 2) options_.chunk_size = kMaxFrameSize / 2;
}

template<typename T>
Result<T> TcpTransport::observe(Result<T> result) {
  if(!connections_) return result;
  if(result.success) {
    connections_->mark_reachable(endpoint_);
  } else if(is_network_kind(result.error.kind)) {
    connections_->mark_unreachable(endpoint_, result.error);
  }
  return result;
}

Result<void> TcpTransport::ping() {
  TcpClient client(options_.io_timeout);
  auto run = [&]() -> Result<void> {
    auto connected = client.connect(endpoint_.host, endpoint_.port, options_.connect_timeout);
    if(!connected.success) return connected;
    auto sent = client.send_json(make_ping());
    if(!sent.success) return sent;
    auto reply = client.read_json(kMaxControlLine);
    if(!reply.success) return Result<void>::Error(reply.error);
    if(reply.data.value("type", std::string()) != "pong") {
      return Result<void>::Error(unexpected_reply(reply.data, "pong"));
    }
    return Result<void>::Ok();
  };
  return observe(run());
}

Result<std::vector<FileRecord>> TcpTransport::manifest() {
  using R = Result<std::vector<FileRecord>>;
  TcpClient client(options_.io_timeout);
  auto run = [&]() -> R {
    auto connected = client.connect(endpoint_.host, endpoint_.port, options_.connect_timeout);
    if(!connected.success) return R::Error(connected.error);
    auto sent = client.send_json(make_manifest_request());
    if(!sent.success) return R::Error(sent.error);
    auto reply = client.read_json(kMaxControlLine);
    if(!reply.success) return R::Error(reply.error);
    if(reply.data.value("type", std::string()) != "manifest_result") {
      return R::Error(unexpected_reply(reply.data, "manifest_result"));
    }
    return R::Ok(manifest_files(reply.data));
  };
  return observe(run());
}

Result<RemoteAck> TcpTransport::push(const FileRecord& source, const std::string& remote_path) {
  using R = Result<RemoteAck>;
  const bool compressed = options_.compression_level > 0;

  FileReader reader;
  auto opened = reader.open(source.absolute_path);
  if(!opened.success) return R::Error(opened.error);

  TcpClient client(options_.io_timeout);
  auto run = [&]() -> R {
    auto connected = client.connect(endpoint_.host, endpoint_.port, options_.connect_timeout);
    if(!connected.success) return R::Error(connected.error);
    auto sent = client.send_json(make_push(source, remote_path, compressed));
    if(!sent.success) return R::Error(sent.error);

    auto reply = client.read_json(kMaxControlLine);
    if(!reply.success) return R::Error(reply.error);
    auto type = reply.data.value("type", std::string());
    if(type == "push_result" && reply.data.value("skipped", false)) {
      RemoteAck ack;
      ack.fingerprint = reply.data.value("fingerprint", std::string());
      ack.skipped = true;
      log_debug(logger_.get(), "push {}: remote already up to date", remote_path);
      return R::Ok(std::move(ack));
    }
    if(type != "push_ready") return R::Error(unexpected_reply(reply.data, "push_ready"));

    std::vector<char> buffer(options_.chunk_size);
    uint64_t sent_bytes = 0;
    while(true) {
      auto got = reader.read(buffer.data(), buffer.size());
      if(!got.success) {
        // the receiver discards the partial body when the connection drops
        client.close();
        return R::Error(got.error);
      }
      if(got.data == 0) break;
      std::string payload;
      if(compressed) {
        auto packed = zstd_compress_frame(buffer.data(), got.data, options_.compression_level);
        if(!packed.success) {
          client.close();
          return R::Error(packed.error);
        }
        payload = std::move(packed.data);
      } else {
        payload.assign(buffer.data(), got.data);
      }
      auto wrote = send_frame(client, payload);
      if(!wrote.success) return R::Error(wrote.error);
      sent_bytes += got.data;
    }
    auto ended = send_frame(client, std::string());
    if(!ended.success) return R::Error(ended.error);

    auto result = client.read_json(kMaxControlLine);
    if(!result.success) return R::Error(result.error);
    if(result.data.value("type", std::string()) != "push_result") {
      return R::Error(unexpected_reply(result.data, "push_result"));
    }
    RemoteAck ack;
    ack.fingerprint = result.data.value("fingerprint", std::string());
    ack.bytes = result.data.value("bytes", sent_bytes);
    if(ack.fingerprint != source.fingerprint) {
      return R::Error(make_error(ErrorKind::ChecksumMismatch,
                                 "remote stored fingerprint " + ack.fingerprint,
                                 remote_path));
    }
    return R::Ok(std::move(ack));
  };
  return observe(run());
}

Result<FileRecord> TcpTransport::pull(const std::string& remote_path,
                                      const std::filesystem::path& local_destination) {
  using R = Result<FileRecord>;
  const bool compressed = options_.compression_level > 0;
  TcpClient client(options_.io_timeout);
  AtomicFileWriter writer;

  auto run = [&]() -> R {
    auto connected = client.connect(endpoint_.host, endpoint_.port, options_.connect_timeout);
    if(!connected.success) return R::Error(connected.error);
    auto sent = client.send_json(make_pull(remote_path, compressed));
    if(!sent.success) return R::Error(sent.error);

    auto header = client.read_json(kMaxControlLine);
    if(!header.success) return R::Error(header.error);
    if(header.data.value("type", std::string()) != "pull_header") {
      return R::Error(unexpected_reply(header.data, "pull_header"));
    }
    auto remote = file_record_from_json(header.data.value("file", json::object()));
    const bool body_compressed = header.data.value("compression", std::string(kCompressionNone)) == kCompressionZstd;

    auto opened = writer.open(local_destination);
    if(!opened.success) {
      client.close();
      return R::Error(opened.error);
    }
    while(true) {
      auto frame = read_frame(client);
      if(!frame.success) return R::Error(frame.error);
      if(frame.data.empty()) break;
      if(body_compressed) {
        auto raw = zstd_decompress_frame(frame.data.data(), frame.data.size(), kMaxFrameSize);
        if(!raw.success) {
          client.close();
          return R::Error(raw.error);
        }
        frame.data = std::move(raw.data);
      }
      auto wrote = writer.write(frame.data.data(), frame.data.size());
      if(!wrote.success) {
        client.close();
        return R::Error(wrote.error);
      }
    }
    auto committed = writer.commit(remote.fingerprint, options_.sync_writes);
    if(!committed.success) return R::Error(committed.error);

    FileRecord local = remote;
    local.relative_path = remote_path;
    local.absolute_path = local_destination;
    local.size = writer.bytes_written();
    local.fingerprint = writer.fingerprint();
    if(auto st = stat_path(local_destination)) local.mtime_ns = st->mtime_ns;
    return R::Ok(std::move(local));
  };
  auto result = run();
  if(!result.success) writer.abort();
  return observe(std::move(result));
}
