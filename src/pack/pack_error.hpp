#pragma once

#include "core/errors/exit_codes.hpp"

#include <string>
#include <string_view>

namespace packforge::pack {

// Failure classes of one compile run. Every kind aborts the run before the
// store batch is committed.
enum class ErrorKind {
  kNone,
  kSource,
  kDecode,
  kSchema,
  kDuplicateKey,
  kStore,
};

struct PackError {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;

  void Set(ErrorKind error_kind, std::string error_message) {
    kind = error_kind;
    message = std::move(error_message);
  }

  void Clear() {
    kind = ErrorKind::kNone;
    message.clear();
  }
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kSource:
    return "source_error";
  case ErrorKind::kDecode:
    return "decode_error";
  case ErrorKind::kSchema:
    return "schema_error";
  case ErrorKind::kDuplicateKey:
    return "duplicate_key_error";
  case ErrorKind::kStore:
    return "store_error";
  }
  return "none";
}

inline core::errors::ExitCode ToExitCode(ErrorKind kind) {
  using core::errors::ExitCode;
  switch (kind) {
  case ErrorKind::kNone:
    return ExitCode::kSuccess;
  case ErrorKind::kSource:
    return ExitCode::kSourceUnavailable;
  case ErrorKind::kDecode:
    return ExitCode::kDecodeFailed;
  case ErrorKind::kSchema:
    return ExitCode::kSchemaInvalid;
  case ErrorKind::kDuplicateKey:
    return ExitCode::kDuplicateKey;
  case ErrorKind::kStore:
    return ExitCode::kStoreFailed;
  }
  return ExitCode::kFailure;
}

} // namespace packforge::pack
