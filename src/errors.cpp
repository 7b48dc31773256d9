#include "errors.hpp"

namespace floword {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConfig:
      return "config_error";
    case ErrorKind::kTransportInit:
      return "transport_init_error";
    case ErrorKind::kTransport:
      return "transport_error";
    case ErrorKind::kToolNotFound:
      return "tool_not_found";
    case ErrorKind::kToolExecution:
      return "tool_execution_error";
    case ErrorKind::kNeedsPermission:
      return "needs_permission";
    case ErrorKind::kAlreadyResolved:
      return "already_resolved";
    case ErrorKind::kBusy:
      return "busy";
    case ErrorKind::kStreamNotFound:
      return "stream_not_found";
    case ErrorKind::kStreamAlreadyExists:
      return "stream_already_exists";
    case ErrorKind::kConversationNotFound:
      return "conversation_not_found";
    case ErrorKind::kForbidden:
      return "forbidden";
    case ErrorKind::kInvalidRequest:
      return "invalid_request_error";
    case ErrorKind::kUpstream:
      return "upstream_error";
    case ErrorKind::kStorage:
      return "storage_error";
  }
  return "unknown_error";
}

int HttpStatusForError(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kToolNotFound:
    case ErrorKind::kStreamNotFound:
    case ErrorKind::kConversationNotFound:
      return 404;
    case ErrorKind::kForbidden:
      return 403;
    case ErrorKind::kNeedsPermission:
    case ErrorKind::kAlreadyResolved:
    case ErrorKind::kBusy:
    case ErrorKind::kStreamAlreadyExists:
      return 409;
    case ErrorKind::kConfig:
    case ErrorKind::kInvalidRequest:
      return 400;
    case ErrorKind::kTransportInit:
    case ErrorKind::kTransport:
    case ErrorKind::kToolExecution:
    case ErrorKind::kUpstream:
      return 502;
    case ErrorKind::kStorage:
      return 500;
  }
  return 500;
}

}  // namespace floword
