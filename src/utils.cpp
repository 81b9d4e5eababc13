#include "utils.hpp"

#include <fcntl.h>
#include <fnmatch.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
  std::ostringstream oss;
  for(auto c : b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
  return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string& data){
  std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
  SHA256((const unsigned char*)data.data(), data.size(), out.data());
  return out;
}

std::string sha256_hex(const std::string& data){
  return hex_from_bytes(sha256_bytes(data));
}

Sha256Stream::Sha256Stream() {
  reset();
}

void Sha256Stream::reset() {
  ok_ = SHA256_Init(&ctx_) == 1;
  finished_ = false;
}

bool Sha256Stream::update(const void* data, std::size_t size) {
  if(!ok_ || finished_) return false;
  if(size == 0) return true;
  ok_ = SHA256_Update(&ctx_, data, size) == 1;
  return ok_;
}

std::string Sha256Stream::final_hex() {
  if(!ok_ || finished_) return std::string();
  unsigned char digest[SHA256_DIGEST_LENGTH];
  finished_ = true;
  if(SHA256_Final(digest, &ctx_) != 1) return std::string();
  return hex_from_bytes(std::vector<unsigned char>(digest, digest + SHA256_DIGEST_LENGTH));
}

std::optional<std::string> sha256_file(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if(!in) return std::nullopt;

  Sha256Stream hasher;
  std::array<char, 65536> buffer{};
  while(in) {
    in.read(buffer.data(), buffer.size());
    std::streamsize read = in.gcount();
    if(read > 0 && !hasher.update(buffer.data(), static_cast<std::size_t>(read))) {
      return std::nullopt;
    }
  }
  if(in.bad()) return std::nullopt;
  auto hex = hasher.final_hex();
  if(hex.empty()) return std::nullopt;
  return hex;
}

void fsync_directory(const std::filesystem::path& dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if(fd < 0) return;
  ::fsync(fd);
  ::close(fd);
}

bool is_valid_utf8(const std::string& text) {
  const auto* p = reinterpret_cast<const unsigned char*>(text.data());
  const auto* end = p + text.size();
  while(p < end) {
    unsigned char c = *p;
    if(c < 0x80) { ++p; continue; }
    std::size_t extra;
    uint32_t cp;
    if((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return false;
    if(static_cast<std::size_t>(end - p) <= extra) return false;
    for(std::size_t i = 1; i <= extra; ++i) {
      if((p[i] & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (p[i] & 0x3F);
    }
    static const uint32_t min_for_length[] = {0, 0x80, 0x800, 0x10000};
    if(cp < min_for_length[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    p += extra + 1;
  }
  return true;
}

bool glob_match(const std::string& pattern, const std::string& text) {
  return ::fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

bool matches_any_component(const std::vector<std::string>& patterns, const std::string& relative_path) {
  if(patterns.empty()) return false;
  std::vector<std::string> components;
  std::string current;
  for(char c : relative_path) {
    if(c == '/') {
      if(!current.empty()) components.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if(!current.empty()) components.push_back(current);

  for(const auto& pattern : patterns) {
    if(pattern.find('/') != std::string::npos) {
      if(::fnmatch(pattern.c_str(), relative_path.c_str(), 0) == 0) return true;
      continue;
    }
    for(const auto& component : components) {
      if(glob_match(pattern, component)) return true;
    }
  }
  return false;
}

std::optional<FileStat> stat_path(const std::filesystem::path& path, int* err) {
  struct stat st{};
  if(::stat(path.c_str(), &st) != 0) {
    if(err) *err = errno;
    return std::nullopt;
  }
  FileStat out;
  out.size = static_cast<uint64_t>(st.st_size);
  out.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
  out.regular = S_ISREG(st.st_mode);
  out.directory = S_ISDIR(st.st_mode);
  if(err) *err = 0;
  return out;
}

std::string format_size(uint64_t bytes) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  if(unit == 0) {
    oss << bytes << " " << units[unit];
  } else {
    oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
  }
  return oss.str();
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

std::vector<std::string> split_list(const std::string& text, char separator) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(text);
  while(std::getline(in, item, separator)) {
    item = trim_copy(item);
    if(!item.empty()) out.push_back(item);
  }
  return out;
}

std::optional<std::string> safe_relative_path(const std::string& candidate) {
  if(candidate.empty()) return std::nullopt;
  std::filesystem::path p(candidate);
  if(p.is_absolute() || p.has_root_name()) return std::nullopt;
  auto normal = p.lexically_normal();
  if(normal.empty() || normal == ".") return std::nullopt;
  for(const auto& part : normal) {
    if(part == "..") return std::nullopt;
  }
  auto out = normal.generic_string();
  if(!out.empty() && out.back() == '/') return std::nullopt;
  return out;
}
