#pragma once

#include <cstddef>
#include <string>

#include "errors.hpp"

// Each body frame is an independent zstd frame carrying its own content size,
// so a receiver can decode frames one at a time with bounded memory.
Result<std::string> zstd_compress_frame(const char* data, std::size_t size, int level);
Result<std::string> zstd_decompress_frame(const char* data, std::size_t size, std::size_t max_output);

int zstd_clamp_level(int level);
