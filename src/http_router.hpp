#pragma once

#include "conversation_controller.hpp"
#include "event_stream.hpp"
#include "mcp_manager.hpp"

#include <httplib.h>

#include <chrono>
#include <functional>
#include <string>

namespace floword {

struct RouterOptions {
  bool allow_anonymous = true;
  // A keepalive comment is written when a stream stays idle this long.
  std::chrono::milliseconds keepalive{std::chrono::seconds(15)};
};

enum class SseOutcome {
  kCompleted,
  kConsumerGone,
};

// Writes what the reader yields as SSE frames: "id: <index>" plus a data line per event, a "lost N events" comment
// when eviction skipped events, and a keepalive comment after each idle period. Stops at end of stream or at the
// first failed write.
SseOutcome WriteStreamEvents(StreamReader* reader,
                             std::chrono::milliseconds keepalive,
                             const std::function<bool(const std::string&)>& write);

class HttpRouter {
 public:
  HttpRouter(ConversationController* conversations, StreamRegistry* streams, McpManager* tools, RouterOptions options);
  void Register(httplib::Server* server);

 private:
  ConversationController* conversations_;
  StreamRegistry* streams_;
  McpManager* tools_;
  RouterOptions options_;
};

}  // namespace floword
