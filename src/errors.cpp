#include "errors.hpp"

#include <cerrno>
#include <cstring>

#include <asio/error.hpp>

namespace {

struct KindEntry {
  ErrorKind kind;
  const char* name;
  ErrorClass error_class;
};

constexpr KindEntry kKindTable[] = {
  {ErrorKind::None,                "none",                 ErrorClass::Retryable},
  {ErrorKind::NetworkTimeout,      "network_timeout",      ErrorClass::Retryable},
  {ErrorKind::ConnectionRefused,   "connection_refused",   ErrorClass::Retryable},
  {ErrorKind::ConnectionLost,      "connection_lost",      ErrorClass::Retryable},
  {ErrorKind::EndpointUnreachable, "endpoint_unreachable", ErrorClass::Retryable},
  {ErrorKind::DeviceBusy,          "device_busy",          ErrorClass::Retryable},
  {ErrorKind::TransientIo,         "transient_io",         ErrorClass::Retryable},
  {ErrorKind::LockContention,      "lock_contention",      ErrorClass::Retryable},
  {ErrorKind::VolumeRemoved,       "volume_removed",       ErrorClass::Retryable},
  {ErrorKind::ChecksumMismatch,    "checksum_mismatch",    ErrorClass::Retryable},
  {ErrorKind::PermissionDenied,    "permission_denied",    ErrorClass::TerminalTask},
  {ErrorKind::DestinationFull,     "destination_full",     ErrorClass::TerminalTask},
  {ErrorKind::SourceUnreadable,    "source_unreadable",    ErrorClass::TerminalTask},
  {ErrorKind::SourceMissing,       "source_missing",       ErrorClass::TerminalTask},
  {ErrorKind::ReadbackMismatch,    "readback_mismatch",    ErrorClass::TerminalTask},
  {ErrorKind::CapacityExceeded,    "capacity_exceeded",    ErrorClass::TerminalTask},
  {ErrorKind::ProtocolError,       "protocol_error",       ErrorClass::TerminalTask},
  {ErrorKind::ConfigInvalid,       "config_invalid",       ErrorClass::TerminalGlobal},
  {ErrorKind::ArchiveInaccessible, "archive_inaccessible", ErrorClass::TerminalGlobal},
  {ErrorKind::StateStoreFailure,   "state_store_failure",  ErrorClass::TerminalGlobal},
};

const KindEntry* find_entry(ErrorKind kind) {
  for(const auto& entry : kKindTable) {
    if(entry.kind == kind) return &entry;
  }
  return nullptr;
}

} // namespace

ErrorClass classify(ErrorKind kind) {
  const auto* entry = find_entry(kind);
  return entry ? entry->error_class : ErrorClass::TerminalTask;
}

const char* to_string(ErrorKind kind) {
  const auto* entry = find_entry(kind);
  return entry ? entry->name : "unknown";
}

const char* to_string(ErrorClass error_class) {
  switch(error_class) {
    case ErrorClass::Retryable: return "retryable";
    case ErrorClass::TerminalTask: return "terminal_task";
    case ErrorClass::TerminalGlobal: return "terminal_global";
  }
  return "unknown";
}

std::optional<ErrorKind> error_kind_from_string(const std::string& name) {
  for(const auto& entry : kKindTable) {
    if(name == entry.name) return entry.kind;
  }
  return std::nullopt;
}

ErrorKind error_kind_from_errno(int err) {
  switch(err) {
    case 0: return ErrorKind::None;
    case ETIMEDOUT: return ErrorKind::NetworkTimeout;
    case ECONNREFUSED: return ErrorKind::ConnectionRefused;
    case ECONNRESET:
    case ECONNABORTED:
    case EPIPE: return ErrorKind::ConnectionLost;
    case EHOSTUNREACH:
    case ENETUNREACH:
    case ENETDOWN: return ErrorKind::EndpointUnreachable;
    case EBUSY:
    case EAGAIN: return ErrorKind::DeviceBusy;
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK: return ErrorKind::LockContention;
#endif
    case ETXTBSY:
    case EDEADLK: return ErrorKind::LockContention;
    case EIO:
    case EINTR: return ErrorKind::TransientIo;
    case ENODEV:
    case ENXIO:
    case ENOMEDIUM: return ErrorKind::VolumeRemoved;
    case EACCES:
    case EPERM:
    case EROFS: return ErrorKind::PermissionDenied;
    case ENOSPC:
    case EDQUOT:
    case EFBIG: return ErrorKind::DestinationFull;
    case ENOENT:
    case ENOTDIR: return ErrorKind::SourceMissing;
    default: return ErrorKind::SourceUnreadable;
  }
}

ErrorKind error_kind_from_error_code(const std::error_code& ec) {
  if(!ec) return ErrorKind::None;
  if(ec == asio::error::timed_out) return ErrorKind::NetworkTimeout;
  if(ec == asio::error::connection_refused) return ErrorKind::ConnectionRefused;
  if(ec == asio::error::eof ||
     ec == asio::error::connection_reset ||
     ec == asio::error::connection_aborted ||
     ec == asio::error::broken_pipe ||
     ec == asio::error::operation_aborted) {
    return ErrorKind::ConnectionLost;
  }
  if(ec == asio::error::host_unreachable ||
     ec == asio::error::network_unreachable ||
     ec == asio::error::network_down ||
     ec == asio::error::host_not_found ||
     ec == asio::error::host_not_found_try_again) {
    return ErrorKind::EndpointUnreachable;
  }
  if(ec.category() == std::generic_category() || ec.category() == std::system_category()) {
    return error_kind_from_errno(ec.value());
  }
  return ErrorKind::TransientIo;
}

std::string SyncError::describe() const {
  std::string out = to_string(kind);
  if(!message.empty()) {
    out += ": " + message;
  }
  if(!path.empty()) {
    out += " (" + path + ")";
  }
  return out;
}

SyncError make_error(ErrorKind kind, std::string message, std::string path) {
  SyncError error;
  error.kind = kind;
  error.message = std::move(message);
  error.path = std::move(path);
  return error;
}

SyncError make_errno_error(int err, const std::string& what, const std::string& path) {
  return make_error(error_kind_from_errno(err), what + ": " + std::strerror(err), path);
}

nlohmann::json sync_error_to_json(const SyncError& error) {
  nlohmann::json j;
  j["kind"] = to_string(error.kind);
  j["class"] = to_string(error.error_class());
  j["message"] = error.message;
  if(!error.path.empty()) j["path"] = error.path;
  return j;
}

SyncError sync_error_from_json(const nlohmann::json& doc) {
  SyncError error;
  if(!doc.is_object()) {
    error.kind = ErrorKind::ProtocolError;
    error.message = "malformed error record";
    return error;
  }
  auto kind = error_kind_from_string(doc.value("kind", std::string()));
  error.kind = kind ? *kind : ErrorKind::ProtocolError;
  error.message = doc.value("message", std::string());
  error.path = doc.value("path", std::string());
  return error;
}
