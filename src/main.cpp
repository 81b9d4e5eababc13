#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "command_line_parser.hpp"
#include "event_sink.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_config.hpp"
#include "sync_orchestrator.hpp"
#include "transfer_server.hpp"
#include "utils.hpp"

namespace {

volatile std::sig_atomic_t g_stop = 0;

void handle_signal(int) {
  g_stop = 1;
}

// Line reader over the stdin descriptor so poll() sees exactly what is unread.
class StdinLines {
public:
  // false once stdin is closed and nothing is buffered.
  bool next(std::string& line, std::chrono::milliseconds timeout) {
    if(take(line)) return true;
    if(closed_) {
      std::this_thread::sleep_for(timeout);
      return false;
    }
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if(rc <= 0) return false;
    char buf[1024];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if(n < 0 && errno == EINTR) return false;
    if(n <= 0) {
      closed_ = true;
      if(!pending_.empty()) {
        line.swap(pending_);
        return true;
      }
      return false;
    }
    pending_.append(buf, static_cast<std::size_t>(n));
    return take(line);
  }

private:
  bool take(std::string& line) {
    auto pos = pending_.find('\n');
    if(pos == std::string::npos) return false;
    line = pending_.substr(0, pos);
    pending_.erase(0, pos + 1);
    return true;
  }

  std::string pending_;
  bool closed_ = false;
};

// Returns false when the daemon should exit.
bool handle_command(const std::string& raw, SyncOrchestrator& orchestrator, Logger& logger) {
  auto line = trim_copy(raw);
  if(line.empty()) return true;
  auto space = line.find(' ');
  auto command = to_lower_copy(line.substr(0, space));
  auto argument = space == std::string::npos ? std::string() : trim_copy(line.substr(space + 1));

  if(command == "quit" || command == "exit") return false;
  if(command == "insert" && !argument.empty()) {
    orchestrator.notify_volume_inserted(argument);
  } else if(command == "remove" && !argument.empty()) {
    orchestrator.notify_volume_removed(argument);
  } else if(command == "sync") {
    orchestrator.trigger_cycle();
  } else if(command == "status") {
    logger.print("{}", orchestrator.status_snapshot().to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
  } else if(command == "dead") {
    auto dead = orchestrator.dead_tasks();
    if(dead.empty()) logger.print("no dead tasks");
    for(const auto& task : dead) {
      logger.print("{} {} {} ({})", task.id, to_string(task.kind), task.source.relative_path,
                   task.last_error ? task.last_error->describe() : std::string("no error recorded"));
    }
  } else if(command == "retry" && !argument.empty()) {
    auto retried = orchestrator.retry_dead(argument);
    if(!retried.success) logger.error("retry {}: {}", argument, retried.error.describe());
  } else {
    logger.warn("Unknown command '{}' (insert <mount>, remove <mount>, sync, status, dead, retry <id>, quit)", line);
  }
  return true;
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings->load();
    settings->apply_environment();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "efsyncd");
    auto parsed = parser.parse(argc, argv, *settings);
    if(!parsed.ok) {
      print_err(nullptr, "{}", parsed.error);
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    auto config = SyncConfig::from_settings(*settings);
    init(config.verbose, config.log_file);
    auto logger = std::make_shared<Logger>("efsyncd");
    if(config.verbose) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    asio::io_context server_io;
    std::unique_ptr<TransferServer> server;
    std::thread server_thread;
    if(config.serve) {
      std::error_code ec;
      std::filesystem::create_directories(config.server.root, ec);
      server = std::make_unique<TransferServer>(server_io, config.server, logger);
      server->start();
      logger->info("Serving {} on {}:{}", config.server.root.string(), config.server.listen_ip, server->port());
      server_thread = std::thread([&server_io](){ server_io.run(); });
    }

    auto stop_server = [&](){
      if(!server) return;
      server->stop();
      if(server_thread.joinable()) server_thread.join();
      server.reset();
    };

    SyncOrchestrator orchestrator(config, logger,
                                  std::make_shared<LoggingEventSink>(std::make_shared<Logger>("efsync-events")));
    auto started = orchestrator.start();
    if(!started.success) {
      logger->error("Unable to start: {}", started.error.describe());
      stop_server();
      return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    StdinLines input;
    std::string line;
    while(!g_stop) {
      if(!input.next(line, std::chrono::milliseconds(200))) continue;
      if(!handle_command(line, orchestrator, *logger)) break;
    }

    orchestrator.stop();
    stop_server();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("efsyncd");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
