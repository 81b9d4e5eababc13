#pragma once

#include <openssl/sha.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string& data);
std::string sha256_hex(const std::string& data);

// Incremental SHA-256 over streamed chunks.
class Sha256Stream {
public:
  Sha256Stream();
  void reset();
  bool update(const void* data, std::size_t size);
  std::string final_hex();

private:
  SHA256_CTX ctx_;
  bool ok_ = true;
  bool finished_ = false;
};

std::optional<std::string> sha256_file(const std::filesystem::path& file);

void fsync_directory(const std::filesystem::path& dir);

bool glob_match(const std::string& pattern, const std::string& text);
bool matches_any_component(const std::vector<std::string>& patterns, const std::string& relative_path);

struct FileStat {
  uint64_t size = 0;
  int64_t mtime_ns = 0; // since the unix epoch
  bool regular = false;
  bool directory = false;
};

std::optional<FileStat> stat_path(const std::filesystem::path& path, int* err = nullptr);
std::string format_size(uint64_t bytes);
std::string to_lower_copy(std::string value);
std::string trim_copy(std::string value);
std::vector<std::string> split_list(const std::string& text, char separator = ',');

// Strict UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool is_valid_utf8(const std::string& text);

// Normalised '/' separated relative path, or nullopt if it escapes the root.
std::optional<std::string> safe_relative_path(const std::string& candidate);
