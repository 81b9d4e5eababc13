#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"
#include "sync_types.hpp"

using json = nlohmann::json;

// protocol.hpp
// Control messages are single JSON lines. Bodies follow push_ready / pull_header
// as frames: 4-byte big-endian length, then the payload. A zero length ends the body.
inline constexpr int kProtocolVersion = 1;
inline constexpr std::size_t kFrameHeaderSize = 4;
inline constexpr std::size_t kMaxFrameSize = 8 * 1024 * 1024;
inline constexpr std::size_t kMaxControlLine = 64 * 1024 * 1024; // manifests of large trees
inline constexpr const char* kCompressionZstd = "zstd";
inline constexpr const char* kCompressionNone = "none";

json make_ping();
json make_pong();

json make_manifest_request();
json make_manifest_result(const std::vector<FileRecord>& files);
std::vector<FileRecord> manifest_files(const json& message);

json make_push(const FileRecord& source, const std::string& remote_path, bool compressed);
json make_push_ready();
json make_push_result(const std::string& fingerprint, uint64_t bytes, bool skipped);

json make_pull(const std::string& remote_path, bool compressed);
json make_pull_header(const FileRecord& record, bool compressed);

json make_error_message(const SyncError& error);
bool is_error_message(const json& message);
SyncError error_from_message(const json& message);

// Any reply that is not the expected type becomes a SyncError.
SyncError unexpected_reply(const json& message, const char* expected);

void encode_frame_length(uint32_t length, unsigned char out[kFrameHeaderSize]);
uint32_t decode_frame_length(const unsigned char in[kFrameHeaderSize]);
