#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "errors.hpp"

class Logger;

struct Endpoint {
  std::string host;
  uint16_t port = 0;

  bool empty() const { return host.empty() || port == 0; }
  std::string to_string() const { return host + ":" + std::to_string(port); }
  bool operator==(const Endpoint& other) const { return host == other.host && port == other.port; }
  bool operator<(const Endpoint& other) const {
    return host < other.host || (host == other.host && port < other.port);
  }

  // Accepts host:port; [v6]:port for IPv6 literals.
  static std::optional<Endpoint> parse(const std::string& text);
};

enum class Reachability {
  Unknown,
  Reachable,
  Unreachable
};

const char* to_string(Reachability state);

struct ProbeResult {
  bool reachable = false;
  std::chrono::milliseconds latency{0};
  SyncError error;
};

struct ConnectionOptions {
  std::chrono::milliseconds probe_timeout{2000};
  std::chrono::milliseconds cache_ttl{5000};
};

class ConnectionManager {
public:
  using Prober = std::function<ProbeResult(const Endpoint&, std::chrono::milliseconds timeout)>;
  using TransitionListener = std::function<void(const Endpoint&, Reachability from, Reachability to)>;
  using ListenerHandle = std::size_t;

  explicit ConnectionManager(ConnectionOptions options = {}, std::shared_ptr<Logger> logger = nullptr);

  // Cached answer while fresh, otherwise a new probe.
  bool is_reachable(const Endpoint& endpoint);
  ProbeResult probe(const Endpoint& endpoint);

  Reachability state(const Endpoint& endpoint) const;
  std::optional<std::chrono::milliseconds> last_latency(const Endpoint& endpoint) const;

  // Fed back from real transfers so the cache reflects what workers just saw.
  void mark_unreachable(const Endpoint& endpoint, const SyncError& cause);
  void mark_reachable(const Endpoint& endpoint);

  void set_prober(Prober prober);
  ListenerHandle add_transition_listener(TransitionListener listener);
  void remove_transition_listener(ListenerHandle handle);

  // Connect-and-close liveness check.
  static ProbeResult tcp_probe(const Endpoint& endpoint, std::chrono::milliseconds timeout);

private:
  struct EndpointState {
    Reachability state = Reachability::Unknown;
    std::chrono::steady_clock::time_point checked_at{};
    std::optional<std::chrono::milliseconds> latency;
    SyncError last_error;
  };

  void record(const Endpoint& endpoint, Reachability next,
              std::optional<std::chrono::milliseconds> latency, const SyncError& error);

  ConnectionOptions options_;
  std::shared_ptr<Logger> logger_;
  Prober prober_;
  std::mutex probe_mutex_; // one probe at a time
  mutable std::mutex mutex_;
  std::map<Endpoint, EndpointState> states_;
  std::map<ListenerHandle, TransitionListener> listeners_;
  ListenerHandle next_listener_ = 1;
};
