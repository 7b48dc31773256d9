#pragma once

#include <string>
#include <utility>

namespace floword {

enum class ErrorKind {
  kConfig,
  kTransportInit,
  kTransport,
  kToolNotFound,
  kToolExecution,
  kNeedsPermission,
  kAlreadyResolved,
  kBusy,
  kStreamNotFound,
  kStreamAlreadyExists,
  kConversationNotFound,
  kForbidden,
  kInvalidRequest,
  kUpstream,
  kStorage,
};

struct Error {
  ErrorKind kind = ErrorKind::kInvalidRequest;
  std::string message;
};

// Stable snake_case name, used as the "type" of HTTP error bodies and stream error events.
const char* ErrorKindName(ErrorKind kind);

int HttpStatusForError(ErrorKind kind);

inline void SetError(Error* err, ErrorKind kind, std::string message) {
  if (!err) return;
  err->kind = kind;
  err->message = std::move(message);
}

}  // namespace floword
