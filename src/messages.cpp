#include "messages.hpp"

#include <chrono>
#include <random>
#include <sstream>
#include <utility>

namespace floword {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static std::string GetString(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

static int64_t GetInt(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_number_integer()) return j[key].get<int64_t>();
  return 0;
}

static std::optional<PartKind> ParsePartKind(const std::string& s) {
  if (s == "system-prompt") return PartKind::kSystemPrompt;
  if (s == "user-prompt") return PartKind::kUserPrompt;
  if (s == "tool-return") return PartKind::kToolReturn;
  if (s == "text") return PartKind::kText;
  if (s == "tool-call") return PartKind::kToolCall;
  return std::nullopt;
}

}  // namespace

void Usage::Incr(const Usage& other, int64_t extra_requests) {
  requests += other.requests + extra_requests;
  request_tokens += other.request_tokens;
  response_tokens += other.response_tokens;
  total_tokens += other.total_tokens;
}

bool operator==(const Usage& a, const Usage& b) {
  return a.requests == b.requests && a.request_tokens == b.request_tokens && a.response_tokens == b.response_tokens &&
         a.total_tokens == b.total_tokens;
}

int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string NewId(const std::string& prefix) {
  return prefix + "-" + Hex(static_cast<uint64_t>(NowMillis())) + "-" + Hex(Rand64());
}

MessagePart MakeSystemPromptPart(std::string content) {
  MessagePart p;
  p.kind = PartKind::kSystemPrompt;
  p.content = std::move(content);
  p.timestamp_ms = NowMillis();
  return p;
}

MessagePart MakeUserPromptPart(std::string content) {
  MessagePart p;
  p.kind = PartKind::kUserPrompt;
  p.content = std::move(content);
  p.timestamp_ms = NowMillis();
  return p;
}

MessagePart MakeTextPart(std::string content) {
  MessagePart p;
  p.kind = PartKind::kText;
  p.content = std::move(content);
  return p;
}

MessagePart MakeToolCallPart(std::string tool_name, nlohmann::json args, std::string tool_call_id) {
  MessagePart p;
  p.kind = PartKind::kToolCall;
  p.tool_name = std::move(tool_name);
  p.args = args.is_null() ? nlohmann::json::object() : std::move(args);
  p.tool_call_id = tool_call_id.empty() ? NewId("call") : std::move(tool_call_id);
  return p;
}

MessagePart MakeToolReturnPart(std::string tool_name, std::string tool_call_id, nlohmann::json result) {
  MessagePart p;
  p.kind = PartKind::kToolReturn;
  p.tool_name = std::move(tool_name);
  p.tool_call_id = std::move(tool_call_id);
  p.result = std::move(result);
  p.timestamp_ms = NowMillis();
  return p;
}

std::vector<MessagePart> ToolCallParts(const ModelMessage& message) {
  std::vector<MessagePart> out;
  if (message.kind != MessageKind::kResponse) return out;
  for (const auto& p : message.parts) {
    if (p.kind == PartKind::kToolCall) out.push_back(p);
  }
  return out;
}

bool HasToolCalls(const ModelMessage& message) {
  if (message.kind != MessageKind::kResponse) return false;
  for (const auto& p : message.parts) {
    if (p.kind == PartKind::kToolCall) return true;
  }
  return false;
}

bool IsErrorResult(const nlohmann::json& call_tool_result) {
  return call_tool_result.is_object() && call_tool_result.contains("isError") &&
         call_tool_result["isError"].is_boolean() && call_tool_result["isError"].get<bool>();
}

std::string TextContent(const ModelMessage& message) {
  std::string out;
  for (const auto& p : message.parts) {
    if (p.kind == PartKind::kText) out += p.content;
  }
  return out;
}

const char* PartKindName(PartKind kind) {
  switch (kind) {
    case PartKind::kSystemPrompt:
      return "system-prompt";
    case PartKind::kUserPrompt:
      return "user-prompt";
    case PartKind::kToolReturn:
      return "tool-return";
    case PartKind::kText:
      return "text";
    case PartKind::kToolCall:
      return "tool-call";
  }
  return "text";
}

nlohmann::json PartToJson(const MessagePart& part) {
  nlohmann::json j;
  j["part_kind"] = PartKindName(part.kind);
  switch (part.kind) {
    case PartKind::kSystemPrompt:
    case PartKind::kUserPrompt:
    case PartKind::kText:
      j["content"] = part.content;
      break;
    case PartKind::kToolCall:
      j["tool_name"] = part.tool_name;
      j["args"] = part.args;
      j["tool_call_id"] = part.tool_call_id;
      break;
    case PartKind::kToolReturn:
      j["tool_name"] = part.tool_name;
      j["tool_call_id"] = part.tool_call_id;
      j["content"] = part.result;
      break;
  }
  if (part.timestamp_ms != 0) j["timestamp"] = part.timestamp_ms;
  return j;
}

bool PartFromJson(const nlohmann::json& j, MessagePart* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "part is not an object";
    return false;
  }
  auto kind = ParsePartKind(GetString(j, "part_kind"));
  if (!kind) {
    if (err) *err = "unknown part_kind: " + GetString(j, "part_kind");
    return false;
  }
  MessagePart p;
  p.kind = *kind;
  p.timestamp_ms = GetInt(j, "timestamp");
  switch (p.kind) {
    case PartKind::kSystemPrompt:
    case PartKind::kUserPrompt:
    case PartKind::kText:
      p.content = GetString(j, "content");
      break;
    case PartKind::kToolCall:
      p.tool_name = GetString(j, "tool_name");
      p.tool_call_id = GetString(j, "tool_call_id");
      if (j.contains("args") && !j["args"].is_null()) p.args = j["args"];
      if (p.tool_name.empty() || p.tool_call_id.empty()) {
        if (err) *err = "tool-call part requires tool_name and tool_call_id";
        return false;
      }
      break;
    case PartKind::kToolReturn:
      p.tool_name = GetString(j, "tool_name");
      p.tool_call_id = GetString(j, "tool_call_id");
      if (j.contains("content")) p.result = j["content"];
      if (p.tool_call_id.empty()) {
        if (err) *err = "tool-return part requires tool_call_id";
        return false;
      }
      break;
  }
  *out = std::move(p);
  return true;
}

nlohmann::json MessageToJson(const ModelMessage& message) {
  nlohmann::json j;
  j["kind"] = message.kind == MessageKind::kRequest ? "request" : "response";
  j["parts"] = nlohmann::json::array();
  for (const auto& p : message.parts) j["parts"].push_back(PartToJson(p));
  if (message.kind == MessageKind::kResponse) {
    j["model_name"] = message.model_name;
    j["timestamp"] = message.timestamp_ms;
  }
  return j;
}

bool MessageFromJson(const nlohmann::json& j, ModelMessage* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "message is not an object";
    return false;
  }
  ModelMessage m;
  const auto kind = GetString(j, "kind");
  if (kind == "request") {
    m.kind = MessageKind::kRequest;
  } else if (kind == "response") {
    m.kind = MessageKind::kResponse;
  } else {
    if (err) *err = "unknown message kind: " + kind;
    return false;
  }
  m.model_name = GetString(j, "model_name");
  m.timestamp_ms = GetInt(j, "timestamp");
  if (j.contains("parts") && j["parts"].is_array()) {
    for (const auto& pj : j["parts"]) {
      MessagePart p;
      if (!PartFromJson(pj, &p, err)) return false;
      m.parts.push_back(std::move(p));
    }
  }
  *out = std::move(m);
  return true;
}

nlohmann::json MessagesToJson(const std::vector<ModelMessage>& messages) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& m : messages) out.push_back(MessageToJson(m));
  return out;
}

std::optional<std::vector<ModelMessage>> MessagesFromJson(const nlohmann::json& j, std::string* err) {
  std::vector<ModelMessage> out;
  if (j.is_null()) return out;
  if (!j.is_array()) {
    if (err) *err = "messages must be an array";
    return std::nullopt;
  }
  out.reserve(j.size());
  for (const auto& mj : j) {
    ModelMessage m;
    if (!MessageFromJson(mj, &m, err)) return std::nullopt;
    out.push_back(std::move(m));
  }
  return out;
}

nlohmann::json UsageToJson(const Usage& usage) {
  return {{"requests", usage.requests},
          {"request_tokens", usage.request_tokens},
          {"response_tokens", usage.response_tokens},
          {"total_tokens", usage.total_tokens}};
}

Usage UsageFromJson(const nlohmann::json& j) {
  Usage u;
  if (!j.is_object()) return u;
  u.requests = GetInt(j, "requests");
  u.request_tokens = GetInt(j, "request_tokens");
  u.response_tokens = GetInt(j, "response_tokens");
  u.total_tokens = GetInt(j, "total_tokens");
  return u;
}

nlohmann::json StreamEventToJson(const StreamEvent& event) {
  nlohmann::json j;
  switch (event.kind) {
    case StreamEventKind::kPartStart:
      j["event_kind"] = "part_start";
      j["index"] = event.index;
      j["part"] = PartToJson(event.part);
      break;
    case StreamEventKind::kPartDelta: {
      j["event_kind"] = "part_delta";
      j["index"] = event.index;
      nlohmann::json d;
      if (event.delta.tool_call) {
        d["part_delta_kind"] = "tool_call";
        if (!event.delta.tool_name_delta.empty()) d["tool_name_delta"] = event.delta.tool_name_delta;
        d["args_delta"] = event.delta.args_delta;
        if (!event.delta.tool_call_id.empty()) d["tool_call_id"] = event.delta.tool_call_id;
      } else {
        d["part_delta_kind"] = "text";
        d["content_delta"] = event.delta.content_delta;
      }
      j["delta"] = std::move(d);
      break;
    }
    case StreamEventKind::kToolReturn:
      j["event_kind"] = "tool_return";
      j["part"] = PartToJson(event.part);
      break;
  }
  return j;
}

nlohmann::json ErrorEventJson(const Error& error) {
  nlohmann::json j;
  j["event_kind"] = "error";
  j["error"] = {{"type", ErrorKindName(error.kind)}, {"message", error.message}};
  return j;
}

}  // namespace floword
