#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <exception>
#include <vector>

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

std::mutex g_sinks_mutex;
DefaultSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr console,
                                            const std::shared_ptr<spdlog::sinks::basic_file_sink_mt>& file) {
  std::vector<spdlog::sink_ptr> sinks{std::move(console)};
  if(file) sinks.push_back(file);
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  spdlog::drop(name);
  spdlog::register_logger(logger);
  return logger;
}

void build_sinks(const std::filesystem::path& log_file) {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kPattern);
  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kPattern);
  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");
  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
  if(!log_file.empty()) {
    std::error_code ec;
    if(log_file.has_parent_path()) {
      std::filesystem::create_directories(log_file.parent_path(), ec);
    }
    try {
      file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
      file_sink->set_pattern(kPattern);
    } catch(const spdlog::spdlog_ex& e) {
      auto note = fmt::format("unable to open log file {}: {}", log_file.string(), e.what());
      error_sink->log(spdlog::details::log_msg("efsync", spdlog::level::err, note));
    }
  }

  g_sinks.info = make_logger("efsync.info", std::move(info_sink), file_sink);
  g_sinks.error = make_logger("efsync.error", std::move(error_sink), file_sink);
  g_sinks.plain_out = make_logger("efsync.print", std::move(plain_out_sink), nullptr);
  g_sinks.plain_err = make_logger("efsync.print_err", std::move(plain_err_sink), file_sink);

  g_sinks.info->flush_on(spdlog::level::warn);
  g_sinks.error->flush_on(spdlog::level::err);
  g_sinks.plain_out->flush_on(spdlog::level::info);
  g_sinks.plain_err->flush_on(spdlog::level::err);
}

DefaultSinks current_sinks() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if(!g_sinks.info) build_sinks({});
  return g_sinks;
}

} // namespace

void init(bool verbose, const std::filesystem::path& log_file) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if(!g_sinks.info || !log_file.empty()) {
    build_sinks(log_file);
  }
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks.info->set_level(level);
  g_sinks.error->set_level(spdlog::level::info);
  g_sinks.plain_out->set_level(spdlog::level::info);
  g_sinks.plain_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_sinks.info);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::write(spdlog::level::level_enum level, const std::string& message) {
  const char* channel = "info";
  switch(level) {
    case spdlog::level::err:
    case spdlog::level::critical: channel = "error"; break;
    case spdlog::level::warn: channel = "warn"; break;
    case spdlog::level::debug:
    case spdlog::level::trace: channel = "debug"; break;
    default: break;
  }
  emit(channel, level, message);
}

void Logger::emit(const char* channel, spdlog::level::level_enum level, const std::string& message) {
  std::string channel_name = name_.empty()
    ? std::string(channel)
    : name_ + ":" + channel;
  if(dispatch(channel_name, level, message)) return;
  detail::emit_to_default(channel, channel_name, level, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", channel, spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto sinks = current_sinks();

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = sinks.plain_out.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = sinks.plain_err.get();
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = sinks.error.get();
  } else {
    sink = sinks.info.get();
  }

  if(!sink) return;
  if(!channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
