#include "protocol.hpp"

namespace {

json record_for_wire(const FileRecord& record) {
  auto j = file_record_to_json(record);
  // local layout never leaves the host
  j.erase("absolute_path");
  return j;
}

} // namespace

json make_ping() {
  json j;
  j["type"] = "ping";
  j["version"] = kProtocolVersion;
  return j;
}

json make_pong() {
  json j;
  j["type"] = "pong";
  j["version"] = kProtocolVersion;
  return j;
}

json make_manifest_request() {
  json j;
  j["type"] = "manifest";
  return j;
}

json make_manifest_result(const std::vector<FileRecord>& files) {
  json j;
  j["type"] = "manifest_result";
  auto arr = json::array();
  for(const auto& record : files) {
    arr.push_back(record_for_wire(record));
  }
  j["files"] = std::move(arr);
  return j;
}

std::vector<FileRecord> manifest_files(const json& message) {
  std::vector<FileRecord> files;
  auto arr = message.value("files", json::array());
  if(!arr.is_array()) return files;
  for(const auto& item : arr) {
    auto record = file_record_from_json(item);
    if(record.relative_path.empty()) continue;
    files.push_back(std::move(record));
  }
  return files;
}

json make_push(const FileRecord& source, const std::string& remote_path, bool compressed) {
  json j;
  j["type"] = "push";
  j["path"] = remote_path;
  j["size"] = source.size;
  j["fingerprint"] = source.fingerprint;
  j["compression"] = compressed ? kCompressionZstd : kCompressionNone;
  return j;
}

json make_push_ready() {
  json j;
  j["type"] = "push_ready";
  return j;
}

json make_push_result(const std::string& fingerprint, uint64_t bytes, bool skipped) {
  json j;
  j["type"] = "push_result";
  j["fingerprint"] = fingerprint;
  j["bytes"] = bytes;
  j["skipped"] = skipped;
  return j;
}

json make_pull(const std::string& remote_path, bool compressed) {
  json j;
  j["type"] = "pull";
  j["path"] = remote_path;
  j["compression"] = compressed ? kCompressionZstd : kCompressionNone;
  return j;
}

json make_pull_header(const FileRecord& record, bool compressed) {
  json j;
  j["type"] = "pull_header";
  j["file"] = record_for_wire(record);
  j["compression"] = compressed ? kCompressionZstd : kCompressionNone;
  return j;
}

json make_error_message(const SyncError& error) {
  json j;
  j["type"] = "error";
  j["error_kind"] = to_string(error.kind);
  j["message"] = error.message;
  j["path"] = error.path;
  return j;
}

bool is_error_message(const json& message) {
  return message.is_object() && message.value("type", std::string()) == "error";
}

SyncError error_from_message(const json& message) {
  SyncError error;
  auto kind = error_kind_from_string(message.value("error_kind", std::string()));
  error.kind = kind ? *kind : ErrorKind::ProtocolError;
  error.message = "remote: " + message.value("message", std::string("unspecified error"));
  error.path = message.value("path", std::string());
  return error;
}

SyncError unexpected_reply(const json& message, const char* expected) {
  if(is_error_message(message)) return error_from_message(message);
  return make_error(ErrorKind::ProtocolError,
                    std::string("expected ") + expected + ", got " +
                    message.value("type", std::string("<none>")));
}

void encode_frame_length(uint32_t length, unsigned char out[kFrameHeaderSize]) {
  out[0] = static_cast<unsigned char>((length >> 24) & 0xff);
  out[1] = static_cast<unsigned char>((length >> 16) & 0xff);
  out[2] = static_cast<unsigned char>((length >> 8) & 0xff);
  out[3] = static_cast<unsigned char>(length & 0xff);
}

uint32_t decode_frame_length(const unsigned char in[kFrameHeaderSize]) {
  return (static_cast<uint32_t>(in[0]) << 24) |
         (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) |
         static_cast<uint32_t>(in[3]);
}
