#include "sync_config.hpp"

#include <sstream>

#include "errors.hpp"
#include "settings_manager.hpp"

const char* to_string(SyncDirection direction) {
  switch(direction) {
    case SyncDirection::Push: return "push";
    case SyncDirection::Pull: return "pull";
  }
  return "push";
}

std::filesystem::path SyncConfig::index_path() const {
  return state_dir / (direction == SyncDirection::Pull ? "local.index.db" : "source.index.db");
}

std::vector<std::string> SyncConfig::validate() const {
  std::vector<std::string> problems;
  if(state_dir.empty()) problems.push_back("state_dir must not be empty");

  if(!endpoint && archive_root.empty() && !serve) {
    problems.push_back("nothing to do: set endpoint, archive_root or serve");
  }
  if(endpoint) {
    if(direction == SyncDirection::Push && source_root.empty()) {
      problems.push_back("direction push needs source_root");
    }
    if(direction == SyncDirection::Pull && local_root.empty()) {
      problems.push_back("direction pull needs local_root");
    }
  }
  if(serve && server.root.empty()) problems.push_back("serve needs serve_root");
  if(serve && endpoint && direction == SyncDirection::Pull && !local_root.empty() && !server.root.empty()) {
    std::error_code a;
    std::error_code b;
    auto local = std::filesystem::weakly_canonical(local_root, a);
    auto served = std::filesystem::weakly_canonical(server.root, b);
    if(!a && !b && local == served) problems.push_back("local_root and serve_root must differ");
  }

  if(retry.max_delay < retry.base_delay) {
    problems.push_back("retry_max_delay_ms must be >= retry_base_delay_ms");
  }
  if(workers < 1 || workers > 8) problems.push_back("workers must be between 1 and 8");
  if(queue.attempt_ceiling < 1) problems.push_back("task_attempt_ceiling must be >= 1");
  if(media.marker_file.empty()) problems.push_back("marker_file must not be empty");
  if(!archive_root.empty() && media.inject_dir.empty()) problems.push_back("inject_dir must not be empty");
  return problems;
}

SyncConfig SyncConfig::from_settings(const SettingsManager& settings) {
  SyncConfig config;
  std::vector<std::string> problems;

  auto path_of = [&](const char* key){ return std::filesystem::path(settings.get<std::string>(key)); };
  auto ms_of = [&](const char* key){ return std::chrono::milliseconds(settings.get<long long>(key)); };

  config.source_root = path_of("source_root");
  config.archive_root = path_of("archive_root");
  config.local_root = path_of("local_root");
  config.state_dir = path_of("state_dir");

  auto endpoint_text = settings.get<std::string>("endpoint");
  if(!endpoint_text.empty()) {
    config.endpoint = Endpoint::parse(endpoint_text);
    if(!config.endpoint) problems.push_back("endpoint '" + endpoint_text + "' is not host:port");
  }

  auto direction = to_lower_copy(settings.get<std::string>("direction"));
  if(direction == "push") {
    config.direction = SyncDirection::Push;
  } else if(direction == "pull") {
    config.direction = SyncDirection::Pull;
  } else {
    problems.push_back("direction must be push or pull, got '" + direction + "'");
  }

  auto extra_excludes = settings.get<std::vector<std::string>>("exclude");
  config.scan.exclude_patterns = ChangeDetector::default_exclude_patterns();
  config.scan.exclude_patterns.insert(config.scan.exclude_patterns.end(),
                                      extra_excludes.begin(), extra_excludes.end());
  auto state_name = config.state_dir.lexically_normal().filename().string();
  if(!state_name.empty() && state_name != "." && state_name != "..") {
    config.scan.exclude_patterns.push_back(state_name);
  }
  config.scan.stability_delay = ms_of("stability_delay_ms");

  config.serve = settings.get<bool>("serve");
  config.server.root = path_of("serve_root");
  config.server.listen_ip = settings.get<std::string>("listen_ip");
  config.server.port = static_cast<uint16_t>(settings.get<long long>("listen_port"));
  config.server.chunk_size = static_cast<std::size_t>(settings.get<long long>("chunk_size"));
  config.server.exclude_patterns = config.scan.exclude_patterns;
  config.server.sync_writes = settings.get<bool>("queue_fsync");

  config.cycle_interval = std::chrono::seconds(settings.get<long long>("cycle_interval_s"));
  config.probe_interval = std::chrono::seconds(settings.get<long long>("probe_interval_s"));
  config.orphan_age = std::chrono::seconds(settings.get<long long>("orphan_age_s"));
  config.workers = static_cast<std::size_t>(settings.get<long long>("workers"));
  config.result_history = static_cast<std::size_t>(settings.get<long long>("result_history"));
  config.verbose = settings.get<bool>("verbose");
  config.log_file = path_of("log_file");

  config.retry.max_attempts = static_cast<uint32_t>(settings.get<long long>("retry_max_attempts"));
  config.retry.base_delay = ms_of("retry_base_delay_ms");
  config.retry.max_delay = ms_of("retry_max_delay_ms");

  config.connection.probe_timeout = ms_of("probe_timeout_ms");
  config.connection.cache_ttl = ms_of("reachability_ttl_ms");

  config.queue.database_path = config.state_dir / "queue.db";
  config.queue.ceiling = static_cast<std::size_t>(settings.get<long long>("queue_ceiling"));
  config.queue.attempt_ceiling = static_cast<uint32_t>(settings.get<long long>("task_attempt_ceiling"));
  config.queue.fsync = settings.get<bool>("queue_fsync");

  config.transfer.chunk_size = static_cast<std::size_t>(settings.get<long long>("chunk_size"));
  config.transfer.readback_verify = settings.get<bool>("readback_verify");
  config.transfer.sync_writes = settings.get<bool>("queue_fsync");

  config.tcp.chunk_size = config.transfer.chunk_size;
  config.tcp.compression_level = static_cast<int>(settings.get<long long>("compression_level"));
  config.tcp.connect_timeout = config.connection.probe_timeout * 2;
  config.tcp.sync_writes = config.transfer.sync_writes;

  config.media.marker_file = settings.get<std::string>("marker_file");
  config.media.inject_dir = settings.get<std::string>("inject_dir");
  config.media.demo_dir = settings.get<std::string>("demo_dir");
  config.media.logbook_dir = settings.get<std::string>("logbook_dir");
  config.media.exclude_patterns = config.scan.exclude_patterns;

  auto more = config.validate();
  problems.insert(problems.end(), more.begin(), more.end());
  if(!problems.empty()) {
    std::ostringstream message;
    message << "invalid configuration:";
    for(const auto& problem : problems) message << "\n  - " << problem;
    throw ConfigError(message.str());
  }
  return config;
}
