#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace floword {

enum class PartKind {
  kSystemPrompt,
  kUserPrompt,
  kToolReturn,
  kText,
  kToolCall,
};

// One part of a turn. Request turns carry system/user prompts and tool returns, response turns carry text and
// proposed tool calls. Unused fields stay empty for a given kind.
struct MessagePart {
  PartKind kind = PartKind::kText;
  std::string content;
  std::string tool_name;
  std::string tool_call_id;
  nlohmann::json args = nlohmann::json::object();
  nlohmann::json result;
  int64_t timestamp_ms = 0;
};

enum class MessageKind {
  kRequest,
  kResponse,
};

struct ModelMessage {
  MessageKind kind = MessageKind::kRequest;
  std::vector<MessagePart> parts;
  std::string model_name;
  int64_t timestamp_ms = 0;
};

struct Usage {
  int64_t requests = 0;
  int64_t request_tokens = 0;
  int64_t response_tokens = 0;
  int64_t total_tokens = 0;

  void Incr(const Usage& other, int64_t extra_requests);
};

bool operator==(const Usage& a, const Usage& b);

enum class StreamEventKind {
  kPartStart,
  kPartDelta,
  kToolReturn,
};

struct PartDelta {
  bool tool_call = false;
  std::string content_delta;
  std::string tool_name_delta;
  std::string args_delta;
  std::string tool_call_id;
};

struct StreamEvent {
  StreamEventKind kind = StreamEventKind::kPartStart;
  int index = 0;
  MessagePart part;
  PartDelta delta;
};

int64_t NowMillis();
std::string NewId(const std::string& prefix);

MessagePart MakeSystemPromptPart(std::string content);
MessagePart MakeUserPromptPart(std::string content);
MessagePart MakeTextPart(std::string content);
MessagePart MakeToolCallPart(std::string tool_name, nlohmann::json args, std::string tool_call_id);
MessagePart MakeToolReturnPart(std::string tool_name, std::string tool_call_id, nlohmann::json result);

// Tool-call parts of a response turn, in order. Empty for request turns.
std::vector<MessagePart> ToolCallParts(const ModelMessage& message);
bool HasToolCalls(const ModelMessage& message);
bool IsErrorResult(const nlohmann::json& call_tool_result);
std::string TextContent(const ModelMessage& message);

const char* PartKindName(PartKind kind);

nlohmann::json PartToJson(const MessagePart& part);
bool PartFromJson(const nlohmann::json& j, MessagePart* out, std::string* err);
nlohmann::json MessageToJson(const ModelMessage& message);
bool MessageFromJson(const nlohmann::json& j, ModelMessage* out, std::string* err);
nlohmann::json MessagesToJson(const std::vector<ModelMessage>& messages);
std::optional<std::vector<ModelMessage>> MessagesFromJson(const nlohmann::json& j, std::string* err);
nlohmann::json UsageToJson(const Usage& usage);
Usage UsageFromJson(const nlohmann::json& j);

nlohmann::json StreamEventToJson(const StreamEvent& event);
nlohmann::json ErrorEventJson(const Error& error);

}  // namespace floword
