#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","source_root"},          {"aliases", {"src","s"}},         {"type","string"}, {"default",""},        {"description","Directory scanned for outgoing files"}, {"persistent", true}},
  {{"key","archive_root"},         {"aliases", {"archive","a"}},     {"type","string"}, {"default",""},        {"description","Canonical archive for removable media"}, {"persistent", true}},
  {{"key","state_dir"},            {"aliases", {"state"}},           {"type","string"}, {"default",".efsync"}, {"description","Queue and file index databases"}, {"persistent", true}},
  {{"key","endpoint"},             {"aliases", {"remote","e"}},      {"type","string"}, {"default",""},        {"description","Remote host:port (empty = no network sync)"}, {"persistent", true}},
  {{"key","direction"},            {"aliases", {"dir"}},             {"type","string"}, {"default","push"},    {"description","push or pull"}, {"persistent", true}},
  {{"key","local_root"},           {"aliases", {"pull_root"}},       {"type","string"}, {"default",""},        {"description","Destination directory for pulled files"}, {"persistent", true}},
  {{"key","serve"},                {"aliases", {"server"}},          {"type","bool"},   {"default",false},     {"description","Accept pushes and pulls from a producer"}, {"persistent", true}},
  {{"key","listen_ip"},            {"aliases", {"li"}},              {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP to bind when serving"}, {"persistent", true}},
  {{"key","listen_port"},          {"aliases", {"lp"}},              {"type","int"},    {"default",9400},      {"min",0}, {"max",65535}, {"description","TCP port to listen on when serving"}, {"persistent", true}},
  {{"key","serve_root"},           {"aliases", {"sr"}},              {"type","string"}, {"default",""},        {"description","Directory served to the remote producer"}, {"persistent", true}},
  {{"key","cycle_interval_s"},     {"aliases", {"interval"}},        {"type","int"},    {"default",60},        {"min",1}, {"description","Seconds between sync cycles"}, {"persistent", true}},
  {{"key","probe_interval_s"},     {"aliases", {"probe"}},           {"type","int"},    {"default",15},        {"min",1}, {"description","Seconds between reachability probes"}, {"persistent", true}},
  {{"key","probe_timeout_ms"},     {"aliases", {}},                  {"type","int"},    {"default",2000},      {"min",1}, {"description","Connect timeout of a reachability probe"}, {"persistent", true}},
  {{"key","reachability_ttl_ms"},  {"aliases", {"ttl"}},             {"type","int"},    {"default",5000},      {"min",0}, {"description","How long a probe result is trusted"}, {"persistent", true}},
  {{"key","retry_max_attempts"},   {"aliases", {"retries"}},         {"type","int"},    {"default",3},         {"min",1}, {"description","In-place attempts per dequeue"}, {"persistent", true}},
  {{"key","retry_base_delay_ms"},  {"aliases", {}},                  {"type","int"},    {"default",1000},      {"min",0}, {"description","First backoff delay"}, {"persistent", true}},
  {{"key","retry_max_delay_ms"},   {"aliases", {}},                  {"type","int"},    {"default",60000},     {"min",0}, {"description","Backoff cap"}, {"persistent", true}},
  {{"key","task_attempt_ceiling"}, {"aliases", {"ceiling"}},         {"type","int"},    {"default",5},         {"min",1}, {"description","Attempts before a task is DEAD"}, {"persistent", true}},
  {{"key","queue_ceiling"},        {"aliases", {}},                  {"type","int"},    {"default",10000},     {"min",1}, {"description","Queue depth before DEAD tasks are evicted"}, {"persistent", true}},
  {{"key","queue_fsync"},          {"aliases", {}},                  {"type","bool"},   {"default",true},      {"description","Flush every queue and index commit to disk"}, {"persistent", true}},
  {{"key","workers"},              {"aliases", {"w","j"}},           {"type","int"},    {"default",2},         {"min",1}, {"max",8}, {"description","Concurrent transfers"}, {"persistent", true}},
  {{"key","chunk_size"},           {"aliases", {}},                  {"type","int"},    {"default",262144},    {"min",4096}, {"max",8388608}, {"description","Transfer chunk size in bytes"}, {"persistent", true}},
  {{"key","compression_level"},    {"aliases", {"z"}},               {"type","int"},    {"default",0},         {"min",0}, {"max",19}, {"description","zstd level for network transfers (0 = off)"}, {"persistent", true}},
  {{"key","stability_delay_ms"},   {"aliases", {}},                  {"type","int"},    {"default",500},       {"min",0}, {"description","Delay between the two stability probes"}, {"persistent", true}},
  {{"key","exclude"},              {"aliases", {"x"}},               {"type","list"},   {"default",nlohmann::json::array()}, {"description","Extra exclude globs (comma separated)"}, {"persistent", true}},
  {{"key","orphan_age_s"},         {"aliases", {}},                  {"type","int"},    {"default",3600},      {"min",0}, {"description","Age before a temporary file is an orphan"}, {"persistent", true}},
  {{"key","result_history"},       {"aliases", {"history"}},         {"type","int"},    {"default",50},        {"min",1}, {"description","Cycle results kept for reporting"}, {"persistent", true}},
  {{"key","marker_file"},          {"aliases", {"marker"}},          {"type","string"}, {"default","EFIS_DRIVE.txt"}, {"description","Identification file at a managed volume root"}, {"persistent", true}},
  {{"key","inject_dir"},           {"aliases", {}},                  {"type","string"}, {"default","updates"}, {"description","Archive subdirectory copied onto volumes"}, {"persistent", true}},
  {{"key","demo_dir"},             {"aliases", {}},                  {"type","string"}, {"default","demo"},    {"description","Archive subdirectory for flight logs and snapshots"}, {"persistent", true}},
  {{"key","logbook_dir"},          {"aliases", {}},                  {"type","string"}, {"default","logbook"}, {"description","Archive subdirectory for logbooks"}, {"persistent", true}},
  {{"key","readback_verify"},      {"aliases", {"verify"}},          {"type","bool"},   {"default",true},      {"description","Re-read local writes before reporting success"}, {"persistent", true}},
  {{"key","verbose"},              {"aliases", {"v"}},               {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},             {"aliases", {"log"}},             {"type","string"}, {"default",""},        {"description","Also write logs to this file"}, {"persistent", true}},
  {{"key","help"},                 {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},         {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed daemon settings. Precedence, lowest first: defaults, settings file,
// EFSYNC_* environment, command line. Every write is checked against the
// specification row for its key.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  bool load() { return load_from_file(settings_path_); }
  bool save() const { return save_to_file(settings_path_); }
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  // EFSYNC_<KEY> variables override file values. Returns the number applied.
  std::size_t apply_environment(const std::string& prefix = "EFSYNC_");

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  // Canonical key for a key or alias, any case.
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  const std::filesystem::path& settings_path() const { return settings_path_; }
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

private:
  enum class ValueType { Bool, Int, String, List };

  struct Row {
    std::string key;
    std::vector<std::string> names; // lower-cased key and aliases
    ValueType type = ValueType::String;
    nlohmann::json default_value;
    std::optional<long long> min_value;
    std::optional<long long> max_value;
    bool persistent = true;
  };

  const Row* find_row(const std::string& token) const;
  bool store(const Row& row, const nlohmann::json& value, std::string& error);
  std::optional<nlohmann::json> parse_text(const Row& row, const std::string& text, std::string& error) const;

  std::vector<Row> rows_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    Row row;
    row.key = entry.at("key").get<std::string>();
    row.names.push_back(to_lower_copy(row.key));
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      row.names.push_back(to_lower_copy(alias));
    }
    const auto type = entry.at("type").get<std::string>();
    if(type == "bool") row.type = ValueType::Bool;
    else if(type == "int") row.type = ValueType::Int;
    else if(type == "list") row.type = ValueType::List;
    else if(type == "string") row.type = ValueType::String;
    else throw std::runtime_error("setting '" + row.key + "' has unknown type '" + type + "'");
    row.default_value = entry.at("default");
    if(entry.contains("min")) row.min_value = entry.at("min").get<long long>();
    if(entry.contains("max")) row.max_value = entry.at("max").get<long long>();
    row.persistent = entry.value("persistent", true);
    values_[row.key] = row.default_value;
    rows_.push_back(std::move(row));
  }
}

inline const SettingsManager::Row* SettingsManager::find_row(const std::string& token) const {
  const auto wanted = to_lower_copy(token);
  for(const auto& row : rows_) {
    if(std::find(row.names.begin(), row.names.end(), wanted) != row.names.end()) return &row;
  }
  return nullptr;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* row = find_row(token)) return row->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* row = find_row(key);
  return row && row->type == ValueType::Bool;
}

inline bool SettingsManager::store(const Row& row, const nlohmann::json& value, std::string& error) {
  switch(row.type) {
    case ValueType::Bool:
      if(value.is_boolean()) {
        values_[row.key] = value.get<bool>();
        return true;
      }
      if(value.is_number_integer()) {
        values_[row.key] = value.get<long long>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;
    case ValueType::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      const auto number = value.get<long long>();
      if((row.min_value && number < *row.min_value) || (row.max_value && number > *row.max_value)) {
        error = "must be in " + (row.min_value ? std::to_string(*row.min_value) : std::string("...")) +
                ".." + (row.max_value ? std::to_string(*row.max_value) : std::string());
        return false;
      }
      values_[row.key] = number;
      return true;
    }
    case ValueType::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      values_[row.key] = value;
      return true;
    case ValueType::List:
      if(!value.is_array() ||
         !std::all_of(value.begin(), value.end(), [](const nlohmann::json& item){ return item.is_string(); })) {
        error = "expected list of strings";
        return false;
      }
      values_[row.key] = value;
      return true;
  }
  error = "unsupported type";
  return false;
}

inline std::optional<nlohmann::json> SettingsManager::parse_text(const Row& row,
                                                                 const std::string& text,
                                                                 std::string& error) const {
  const auto clean = trim_copy(text);
  switch(row.type) {
    case ValueType::Bool: {
      const auto v = to_lower_copy(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return nlohmann::json(true);
      if(v == "false" || v == "0" || v == "off" || v == "no") return nlohmann::json(false);
      error = "expected boolean (true|false|on|off)";
      return std::nullopt;
    }
    case ValueType::Int: {
      long long number = 0;
      std::size_t consumed = 0;
      try {
        number = std::stoll(clean, &consumed);
      } catch(const std::exception&) {
        consumed = 0;
      }
      if(clean.empty() || consumed != clean.size()) {
        error = "expected integer";
        return std::nullopt;
      }
      return nlohmann::json(number);
    }
    case ValueType::String:
      return nlohmann::json(clean);
    case ValueType::List:
      return nlohmann::json(split_list(clean, ','));
  }
  error = "unsupported type";
  return std::nullopt;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  error.clear();
  const auto* row = find_row(key);
  if(!row) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_text(*row, value, error);
  return parsed && store(*row, *parsed, error);
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* row = find_row(item.key());
    if(!row || !row->persistent) continue;
    std::string error;
    if(!store(*row, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& row : rows_) {
    if(row.persistent) doc[row.key] = values_.at(row.key);
  }
  out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  return static_cast<bool>(out);
}

inline std::size_t SettingsManager::apply_environment(const std::string& prefix) {
  std::size_t applied = 0;
  for(const auto& row : rows_) {
    if(!row.persistent) continue;
    std::string name = prefix;
    for(char c : row.key) name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    const char* value = std::getenv(name.c_str());
    if(!value) continue;
    std::string error;
    if(set_from_string(row.key, value, error)) {
      ++applied;
    } else {
      print_err(nullptr, "Ignoring {}: {}", name, error);
    }
  }
  return applied;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
