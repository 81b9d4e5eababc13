#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "change_detector.hpp"
#include "connection_manager.hpp"
#include "media_reconciler.hpp"
#include "operation_queue.hpp"
#include "remote_transport.hpp"
#include "retry_policy.hpp"
#include "transfer_engine.hpp"
#include "transfer_server.hpp"

class SettingsManager;

enum class SyncDirection {
  Push,
  Pull
};

const char* to_string(SyncDirection direction);

// Typed, read-only view of the settings. Built and validated once at startup;
// components get their sub-structs by value.
struct SyncConfig {
  std::filesystem::path source_root;
  std::filesystem::path archive_root;
  std::filesystem::path local_root;
  std::filesystem::path state_dir = ".efsync";

  std::optional<Endpoint> endpoint;
  SyncDirection direction = SyncDirection::Push;

  bool serve = false;
  TransferServerOptions server;

  std::chrono::seconds cycle_interval{60};
  std::chrono::seconds probe_interval{15};
  std::chrono::seconds orphan_age{3600};
  std::size_t workers = 2;
  std::size_t result_history = 50;
  bool verbose = false;
  std::filesystem::path log_file;

  ScanOptions scan;
  RetryOptions retry;
  ConnectionOptions connection;
  QueueOptions queue;
  TransferOptions transfer;
  TcpTransportOptions tcp;
  MediaOptions media;

  std::filesystem::path index_path() const;

  // Every problem found, empty when the configuration is usable.
  std::vector<std::string> validate() const;

  // Throws ConfigError listing every validation problem.
  static SyncConfig from_settings(const SettingsManager& settings);
};
