#pragma once

#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace ragrank {

// Error taxonomy expressed as rocksdb::Status codes.
//
//   ConfigurationError  -> InvalidArgument  (fatal, caught at Open where possible)
//   BackendUnavailable  -> IOError / TimedOut (one adapter down, excluded from fusion)
//   NoSearchableBackend -> Aborted           (every adapter failed for this query)
//
// An empty result is not an error: OK with zero results.

inline rocksdb::Status ConfigurationError(const std::string& msg) {
  return rocksdb::Status::InvalidArgument(msg);
}

inline rocksdb::Status BackendUnavailable(std::string_view backend,
                                          const std::string& detail) {
  return rocksdb::Status::IOError("backend unavailable: " + std::string(backend),
                                  detail);
}

inline rocksdb::Status DeadlineExceeded(std::string_view what) {
  return rocksdb::Status::TimedOut("deadline exceeded: " + std::string(what));
}

inline rocksdb::Status NoSearchableBackend(const std::string& detail) {
  return rocksdb::Status::Aborted("no searchable backend", detail);
}

inline bool IsConfigurationError(const rocksdb::Status& s) {
  return s.IsInvalidArgument();
}

inline bool IsBackendUnavailable(const rocksdb::Status& s) {
  return s.IsIOError() || s.IsTimedOut();
}

inline bool IsNoSearchableBackend(const rocksdb::Status& s) {
  return s.IsAborted();
}

// Map statuses to low-cardinality strings for tracing and response attribution.
inline std::string_view StatusKind(const rocksdb::Status& s) {
  if (s.ok()) return "ok";
  if (s.IsNotFound()) return "not_found";
  if (s.IsInvalidArgument()) return "invalid_argument";
  if (s.IsTimedOut()) return "timed_out";
  if (s.IsBusy()) return "busy";
  if (s.IsAborted()) return "aborted";
  if (s.IsCorruption()) return "corruption";
  if (s.IsIOError()) return "io_error";
  if (s.IsNotSupported()) return "not_supported";
  return "other";
}

}  // namespace ragrank
