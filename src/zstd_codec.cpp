#include "zstd_codec.hpp"

#include <zstd.h>

#include <algorithm>

int zstd_clamp_level(int level) {
  return std::clamp(level, 1, ZSTD_maxCLevel());
}

Result<std::string> zstd_compress_frame(const char* data, std::size_t size, int level) {
  std::string out;
  out.resize(ZSTD_compressBound(size));
  size_t written = ZSTD_compress(out.data(), out.size(), data, size, zstd_clamp_level(level));
  if(ZSTD_isError(written)) {
    return Result<std::string>::Error(make_error(ErrorKind::ProtocolError,
                                                 std::string("zstd compression failed: ") + ZSTD_getErrorName(written)));
  }
  out.resize(written);
  return Result<std::string>::Ok(std::move(out));
}

Result<std::string> zstd_decompress_frame(const char* data, std::size_t size, std::size_t max_output) {
  unsigned long long content_size = ZSTD_getFrameContentSize(data, size);
  if(content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    return Result<std::string>::Error(make_error(ErrorKind::ChecksumMismatch, "corrupt zstd frame header"));
  }
  if(content_size > max_output) {
    return Result<std::string>::Error(make_error(ErrorKind::ProtocolError, "zstd frame exceeds the frame size limit"));
  }
  std::string out;
  out.resize(static_cast<std::size_t>(content_size));
  size_t result = ZSTD_decompress(out.data(), out.size(), data, size);
  if(ZSTD_isError(result) || result != out.size()) {
    // damaged in transit; the file is retried from scratch
    return Result<std::string>::Error(make_error(ErrorKind::ChecksumMismatch,
                                                 std::string("zstd decompression failed: ") +
                                                 (ZSTD_isError(result) ? ZSTD_getErrorName(result) : "short frame")));
  }
  return Result<std::string>::Ok(std::move(out));
}
