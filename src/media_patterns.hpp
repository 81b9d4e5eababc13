#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "sync_types.hpp"

// Dotted version embedded in an artifact name: nav_v1.2.3.db, app_1.2.zip, fw-10.4.1.bin.
std::optional<std::string> parse_version_tag(const std::string& filename);
// Lowercased name with the version tag removed: nav_v1.2.3.db -> nav.db
std::string artifact_stem(const std::string& filename);
// <0, 0, >0 like strcmp; missing components count as zero.
int compare_versions(const std::string& a, const std::string& b);

struct DemoLogName {
  std::string date; // YYYY-MM-DD
  std::optional<int> flight;
};

std::optional<DemoLogName> parse_demo_log_name(const std::string& filename);
// YYYY-MM-DD_HHMMSS for SNAP_YYYYMMDD_HHMMSS.png and Screenshot_YYYY-MM-DD_HH-MM-SS.png
std::optional<std::string> snapshot_timestamp(const std::string& filename);
bool looks_like_logbook(const std::string& filename);

struct LogbookSummary {
  std::size_t entries = 0;
  std::optional<std::string> first_date;
  std::optional<std::string> last_date;
};

LogbookSummary summarize_logbook(const std::filesystem::path& csv);
std::string logbook_archive_name(const LogbookSummary& summary, const std::string& fallback_date);
// Accepts YYYY-MM-DD, MM/DD/YYYY and YYYYMMDD.
std::optional<std::string> normalize_date(const std::string& text);
std::string local_date_from_ns(int64_t epoch_ns);

struct MediaLayout {
  std::string demo_dir = "demo";
  std::string logbook_dir = "logbook";
};

struct ExtractRule {
  MediaCategory category = MediaCategory::None;
  std::filesystem::path archive_relative;
};

// Archive location for a device-generated file, or nullopt when the file is not one.
std::optional<ExtractRule> classify_media_file(const FileRecord& record, const MediaLayout& layout);
