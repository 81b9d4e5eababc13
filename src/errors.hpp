#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

enum class ErrorKind {
  None,
  // retryable
  NetworkTimeout,
  ConnectionRefused,
  ConnectionLost,
  EndpointUnreachable,
  DeviceBusy,
  TransientIo,
  LockContention,
  VolumeRemoved,
  ChecksumMismatch,
  // terminal for one task
  PermissionDenied,
  DestinationFull,
  SourceUnreadable,
  SourceMissing,
  ReadbackMismatch,
  CapacityExceeded,
  ProtocolError,
  // terminal for the whole cycle
  ConfigInvalid,
  ArchiveInaccessible,
  StateStoreFailure
};

enum class ErrorClass {
  Retryable,
  TerminalTask,
  TerminalGlobal
};

// Policy table: which kinds consume retry budget and which propagate immediately.
ErrorClass classify(ErrorKind kind);
inline bool is_retryable(ErrorKind kind) { return classify(kind) == ErrorClass::Retryable; }

const char* to_string(ErrorKind kind);
const char* to_string(ErrorClass error_class);
std::optional<ErrorKind> error_kind_from_string(const std::string& name);

ErrorKind error_kind_from_errno(int err);
ErrorKind error_kind_from_error_code(const std::error_code& ec);

struct SyncError {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::string path;

  ErrorClass error_class() const { return classify(kind); }
  bool retryable() const { return is_retryable(kind); }
  std::string describe() const;
};

SyncError make_error(ErrorKind kind, std::string message, std::string path = std::string());
SyncError make_errno_error(int err, const std::string& what, const std::string& path = std::string());

nlohmann::json sync_error_to_json(const SyncError& error);
SyncError sync_error_from_json(const nlohmann::json& doc);

template<typename T>
struct Result {
  bool success = false;
  SyncError error;
  T data{};

  static Result<T> Ok(T value) {
    Result<T> r;
    r.success = true;
    r.data = std::move(value);
    return r;
  }

  static Result<T> Error(SyncError err) {
    Result<T> r;
    r.error = std::move(err);
    return r;
  }

  explicit operator bool() const { return success; }
};

template<>
struct Result<void> {
  bool success = false;
  SyncError error;

  static Result<void> Ok() {
    Result<void> r;
    r.success = true;
    return r;
  }

  static Result<void> Error(SyncError err) {
    Result<void> r;
    r.error = std::move(err);
    return r;
  }

  explicit operator bool() const { return success; }
};

// Thrown for setup problems the host cannot recover from (bad configuration, unusable listen socket).
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
