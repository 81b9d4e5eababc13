#include "media_patterns.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <regex>
#include <vector>

#include "utils.hpp"

namespace {

const std::regex kVersionPattern(R"((?:^|[^0-9A-Za-z])[vV]?(\d+(?:\.\d+)+)(?=$|[^0-9A-Za-z]))");
const std::regex kDemoPattern(R"(^DEMO-(\d{4})(\d{2})(\d{2})-(\d{6})(?:\+(\d{1,6}))?\.LOG$)", std::regex::icase);
const std::regex kSnapPattern(R"(SNAP_(\d{4})(\d{2})(\d{2})_(\d{6})\.png$)", std::regex::icase);
const std::regex kScreenshotPattern(R"(Screenshot_(\d{4})-(\d{2})-(\d{2})_(\d{2})-(\d{2})-(\d{2})\.png$)", std::regex::icase);

// The extension is only split off when it is not part of a dotted number.
std::pair<std::string, std::string> split_extension(const std::string& filename) {
  auto dot = filename.rfind('.');
  if(dot == std::string::npos || dot == 0) return {filename, std::string()};
  auto ext = filename.substr(dot);
  bool has_alpha = std::any_of(ext.begin(), ext.end(), [](unsigned char c){ return std::isalpha(c) != 0; });
  if(!has_alpha) return {filename, std::string()};
  return {filename.substr(0, dot), ext};
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;
  for(std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if(quoted) {
      if(c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        current.push_back('"');
        ++i;
      } else if(c == '"') {
        quoted = false;
      } else {
        current.push_back(c);
      }
    } else if(c == '"') {
      quoted = true;
    } else if(c == ',') {
      fields.push_back(trim_copy(current));
      current.clear();
    } else if(c != '\r') {
      current.push_back(c);
    }
  }
  fields.push_back(trim_copy(current));
  return fields;
}

bool valid_date(int year, int month, int day) {
  return year >= 1900 && year <= 2200 && month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

std::string format_date(int year, int month, int day) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return buf;
}

bool path_starts_with_dir(const std::filesystem::path& relative, const std::string& dir) {
  auto it = relative.begin();
  if(it == relative.end()) return false;
  return to_lower_copy(it->string()) == to_lower_copy(dir);
}

std::size_t depth_of(const std::filesystem::path& relative) {
  return static_cast<std::size_t>(std::distance(relative.begin(), relative.end()));
}

} // namespace

std::optional<std::string> parse_version_tag(const std::string& filename) {
  auto stem = split_extension(filename).first;
  std::smatch match;
  if(std::regex_search(stem, match, kVersionPattern)) {
    return match[1].str();
  }
  return std::nullopt;
}

std::string artifact_stem(const std::string& filename) {
  auto parts = split_extension(filename);
  auto stem = std::regex_replace(parts.first, kVersionPattern, "");
  while(!stem.empty() && (stem.back() == '_' || stem.back() == '-' || stem.back() == ' ' || stem.back() == '.')) {
    stem.pop_back();
  }
  return to_lower_copy(stem + parts.second);
}

int compare_versions(const std::string& a, const std::string& b) {
  auto left = split_list(a, '.');
  auto right = split_list(b, '.');
  std::size_t n = std::max(left.size(), right.size());
  for(std::size_t i = 0; i < n; ++i) {
    unsigned long long l = 0;
    unsigned long long r = 0;
    try {
      if(i < left.size()) l = std::stoull(left[i]);
      if(i < right.size()) r = std::stoull(right[i]);
    } catch(const std::exception&) {
      return a.compare(b);
    }
    if(l != r) return l < r ? -1 : 1;
  }
  return 0;
}

std::optional<DemoLogName> parse_demo_log_name(const std::string& filename) {
  std::smatch match;
  if(!std::regex_match(filename, match, kDemoPattern)) return std::nullopt;
  int year = std::stoi(match[1].str());
  int month = std::stoi(match[2].str());
  int day = std::stoi(match[3].str());
  if(!valid_date(year, month, day)) return std::nullopt;
  DemoLogName name;
  name.date = format_date(year, month, day);
  if(match[5].matched) name.flight = std::stoi(match[5].str());
  return name;
}

std::optional<std::string> snapshot_timestamp(const std::string& filename) {
  std::smatch match;
  if(std::regex_search(filename, match, kSnapPattern)) {
    return match[1].str() + "-" + match[2].str() + "-" + match[3].str() + "_" + match[4].str();
  }
  if(std::regex_search(filename, match, kScreenshotPattern)) {
    return match[1].str() + "-" + match[2].str() + "-" + match[3].str() + "_" +
           match[4].str() + match[5].str() + match[6].str();
  }
  return std::nullopt;
}

bool looks_like_logbook(const std::string& filename) {
  auto lower = to_lower_copy(filename);
  if(lower.size() < 4 || lower.compare(lower.size() - 4, 4, ".csv") != 0) return false;
  // "log" also covers "logbook"
  return lower.find("log") != std::string::npos || lower.find("flight") != std::string::npos;
}

std::optional<std::string> normalize_date(const std::string& text) {
  static const std::regex iso(R"(^(\d{4})-(\d{1,2})-(\d{1,2})$)");
  static const std::regex us(R"(^(\d{1,2})/(\d{1,2})/(\d{4})$)");
  static const std::regex compact(R"(^(\d{4})(\d{2})(\d{2})$)");
  auto value = trim_copy(text);
  std::smatch m;
  int year = 0;
  int month = 0;
  int day = 0;
  if(std::regex_match(value, m, iso) || std::regex_match(value, m, compact)) {
    year = std::stoi(m[1].str());
    month = std::stoi(m[2].str());
    day = std::stoi(m[3].str());
  } else if(std::regex_match(value, m, us)) {
    month = std::stoi(m[1].str());
    day = std::stoi(m[2].str());
    year = std::stoi(m[3].str());
  } else {
    return std::nullopt;
  }
  if(!valid_date(year, month, day)) return std::nullopt;
  return format_date(year, month, day);
}

LogbookSummary summarize_logbook(const std::filesystem::path& csv) {
  static const char* kDateColumns[] = {"date", "flight_date", "Date", "Flight Date"};
  LogbookSummary summary;
  std::ifstream in(csv);
  if(!in) return summary;

  std::string line;
  if(!std::getline(in, line)) return summary;
  auto header = split_csv_line(line);
  std::vector<std::size_t> date_columns;
  for(std::size_t i = 0; i < header.size(); ++i) {
    for(const char* name : kDateColumns) {
      if(header[i] == name) date_columns.push_back(i);
    }
  }

  while(std::getline(in, line)) {
    if(trim_copy(line).empty()) continue;
    ++summary.entries;
    auto fields = split_csv_line(line);
    for(auto column : date_columns) {
      if(column >= fields.size()) continue;
      auto date = normalize_date(fields[column]);
      if(!date) continue;
      if(!summary.first_date || *date < *summary.first_date) summary.first_date = *date;
      if(!summary.last_date || *date > *summary.last_date) summary.last_date = *date;
      break;
    }
  }
  return summary;
}

std::string logbook_archive_name(const LogbookSummary& summary, const std::string& fallback_date) {
  std::string prefix = fallback_date;
  if(summary.first_date && summary.last_date) {
    prefix = *summary.first_date;
    if(*summary.last_date != *summary.first_date) prefix += "_to_" + *summary.last_date;
  }
  return prefix + "_logbook_" + std::to_string(summary.entries) + "entries.csv";
}

std::string local_date_from_ns(int64_t epoch_ns) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ns / 1000000000);
  std::tm tm{};
  localtime_r(&seconds, &tm);
  return format_date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

std::optional<ExtractRule> classify_media_file(const FileRecord& record, const MediaLayout& layout) {
  const std::filesystem::path relative(record.relative_path);
  const auto filename = relative.filename().string();
  const auto depth = depth_of(relative);

  if(depth == 1 || (depth == 2 && path_starts_with_dir(relative, "DEMO"))) {
    if(auto demo = parse_demo_log_name(filename)) {
      ExtractRule rule;
      rule.category = MediaCategory::FlightLog;
      std::string name = demo->date + "_";
      if(demo->flight) name += "flight-" + std::to_string(*demo->flight) + "_";
      rule.archive_relative = std::filesystem::path(layout.demo_dir) / (name + filename);
      return rule;
    }
  }

  if(depth == 1 || (depth == 2 && path_starts_with_dir(relative, "SNAP"))) {
    if(to_lower_copy(relative.extension().string()) == ".png") {
      ExtractRule rule;
      rule.category = MediaCategory::Snapshot;
      auto stamp = snapshot_timestamp(filename);
      rule.archive_relative = std::filesystem::path(layout.demo_dir) / "snapshots" /
                              (stamp ? *stamp + "_" + filename : filename);
      return rule;
    }
  }

  if(looks_like_logbook(filename)) {
    ExtractRule rule;
    rule.category = MediaCategory::Logbook;
    auto summary = summarize_logbook(record.absolute_path);
    rule.archive_relative = std::filesystem::path(layout.logbook_dir) /
                            logbook_archive_name(summary, local_date_from_ns(record.mtime_ns));
    return rule;
  }
  return std::nullopt;
}
