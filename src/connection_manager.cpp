#include "connection_manager.hpp"

#include <vector>

#include "log.hpp"
#include "tcp_client.hpp"

std::optional<Endpoint> Endpoint::parse(const std::string& text) {
  if(text.empty()) return std::nullopt;
  std::string host;
  std::string port_text;
  if(text.front() == '[') {
    auto close = text.find(']');
    if(close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
      return std::nullopt;
    }
    host = text.substr(1, close - 1);
    port_text = text.substr(close + 2);
  } else {
    auto pos = text.rfind(':');
    if(pos == std::string::npos || pos == 0) return std::nullopt;
    host = text.substr(0, pos);
    port_text = text.substr(pos + 1);
  }
  if(host.empty() || port_text.empty()) return std::nullopt;
  try {
    std::size_t consumed = 0;
    int port = std::stoi(port_text, &consumed);
    if(consumed != port_text.size() || port <= 0 || port > 65535) return std::nullopt;
    return Endpoint{host, static_cast<uint16_t>(port)};
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

const char* to_string(Reachability state) {
  switch(state) {
    case Reachability::Unknown: return "unknown";
    case Reachability::Reachable: return "reachable";
    case Reachability::Unreachable: return "unreachable";
  }
  return "unknown";
}

ConnectionManager::ConnectionManager(ConnectionOptions options, std::shared_ptr<Logger> logger)
  : options_(options),
    logger_(std::move(logger)),
    prober_(&ConnectionManager::tcp_probe) {}

void ConnectionManager::set_prober(Prober prober) {
  std::lock_guard<std::mutex> lock(mutex_);
  prober_ = prober ? std::move(prober) : Prober(&ConnectionManager::tcp_probe);
}

ConnectionManager::ListenerHandle ConnectionManager::add_transition_listener(TransitionListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto handle = next_listener_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void ConnectionManager::remove_transition_listener(ListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

Reachability ConnectionManager::state(const Endpoint& endpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = states_.find(endpoint);
  return it == states_.end() ? Reachability::Unknown : it->second.state;
}

std::optional<std::chrono::milliseconds> ConnectionManager::last_latency(const Endpoint& endpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = states_.find(endpoint);
  if(it == states_.end()) return std::nullopt;
  return it->second.latency;
}

bool ConnectionManager::is_reachable(const Endpoint& endpoint) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(endpoint);
    if(it != states_.end() && it->second.state != Reachability::Unknown) {
      auto age = std::chrono::steady_clock::now() - it->second.checked_at;
      if(age < options_.cache_ttl) {
        return it->second.state == Reachability::Reachable;
      }
    }
  }
  return probe(endpoint).reachable;
}

ProbeResult ConnectionManager::probe(const Endpoint& endpoint) {
  std::lock_guard<std::mutex> probe_lock(probe_mutex_);
  Prober prober;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    prober = prober_;
  }
  ProbeResult result;
  if(endpoint.empty()) {
    result.error = make_error(ErrorKind::ConfigInvalid, "no endpoint configured");
  } else {
    result = prober(endpoint, options_.probe_timeout);
  }
  if(result.reachable) {
    log_debug(logger_.get(), "probe {}: reachable ({} ms)", endpoint.to_string(), result.latency.count());
    record(endpoint, Reachability::Reachable, result.latency, SyncError{});
  } else {
    log_debug(logger_.get(), "probe {}: unreachable: {}", endpoint.to_string(), result.error.describe());
    record(endpoint, Reachability::Unreachable, std::nullopt, result.error);
  }
  return result;
}

void ConnectionManager::mark_unreachable(const Endpoint& endpoint, const SyncError& cause) {
  record(endpoint, Reachability::Unreachable, std::nullopt, cause);
}

void ConnectionManager::mark_reachable(const Endpoint& endpoint) {
  record(endpoint, Reachability::Reachable, std::nullopt, SyncError{});
}

void ConnectionManager::record(const Endpoint& endpoint, Reachability next,
                               std::optional<std::chrono::milliseconds> latency,
                               const SyncError& error) {
  Reachability previous = Reachability::Unknown;
  std::vector<TransitionListener> to_notify;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = states_[endpoint];
    previous = entry.state;
    entry.state = next;
    entry.checked_at = std::chrono::steady_clock::now();
    if(latency) entry.latency = latency;
    entry.last_error = error;
    if(previous != next) {
      for(const auto& listener : listeners_) to_notify.push_back(listener.second);
    }
  }
  if(previous == next) return;

  if(next == Reachability::Unreachable) {
    log_info(logger_.get(), "endpoint {} is now unreachable ({})", endpoint.to_string(), error.describe());
  } else {
    log_info(logger_.get(), "endpoint {} is now {}", endpoint.to_string(), to_string(next));
  }
  for(auto& listener : to_notify) {
    if(listener) listener(endpoint, previous, next);
  }
}

ProbeResult ConnectionManager::tcp_probe(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
  ProbeResult result;
  auto start = std::chrono::steady_clock::now();
  TcpClient client(timeout);
  auto connected = client.connect(endpoint.host, endpoint.port, timeout);
  if(!connected.success) {
    result.error = connected.error;
    return result;
  }
  client.close();
  result.reachable = true;
  result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start);
  return result;
}
