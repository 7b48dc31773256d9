#include "conversation_agent.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <set>
#include <utility>

namespace floword {
namespace {

static nlohmann::json ErrorToolResult(const std::string& message) {
  return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", message}}})}, {"isError", true}};
}

static bool EndsWithPendingCalls(const std::vector<ModelMessage>& history) {
  return !history.empty() && HasToolCalls(history.back());
}

}  // namespace

const char* AgentStateName(AgentState state) {
  switch (state) {
    case AgentState::kIdle:
      return "idle";
    case AgentState::kAwaitingModel:
      return "awaiting_model";
    case AgentState::kAwaitingPermission:
      return "awaiting_permission";
  }
  return "idle";
}

ConversationAgent::ConversationAgent(IModelEngine* engine,
                                     McpManager* tools,
                                     std::string system_prompt,
                                     std::vector<ModelMessage> history,
                                     Usage usage)
    : engine_(engine), tools_(tools), system_prompt_(std::move(system_prompt)), history_(std::move(history)),
      usage_(usage) {
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->kind == MessageKind::kResponse) {
      last_response_ = *it;
      break;
    }
  }
}

bool ConversationAgent::CheckCanChatLocked(Error* err) const {
  if (busy_) {
    SetError(err, ErrorKind::kBusy, "conversation is already processing a request");
    return false;
  }
  if (EndsWithPendingCalls(history_)) {
    SetError(err, ErrorKind::kNeedsPermission, "pending tool calls must be permitted or declined first");
    return false;
  }
  return true;
}

bool ConversationAgent::CheckCanPermitLocked(const PermitDecision& decision, Error* err) const {
  if (busy_) {
    SetError(err, ErrorKind::kBusy, "conversation is already processing a request");
    return false;
  }
  if (!EndsWithPendingCalls(history_)) {
    SetError(err, ErrorKind::kAlreadyResolved, "no pending tool calls");
    return false;
  }
  std::set<std::string> pending_ids;
  for (const auto& p : ToolCallParts(history_.back())) pending_ids.insert(p.tool_call_id);
  for (const auto& id : decision.tool_call_ids) {
    if (!pending_ids.count(id)) {
      SetError(err, ErrorKind::kInvalidRequest, "unknown tool call id: " + id);
      return false;
    }
  }
  for (const auto& p : decision.edited_calls) {
    if (p.kind != PartKind::kToolCall || !pending_ids.count(p.tool_call_id)) {
      SetError(err, ErrorKind::kInvalidRequest, "edited tool call does not match a pending call: " + p.tool_call_id);
      return false;
    }
  }
  return true;
}

bool ConversationAgent::CheckCanResumeLocked(Error* err) const {
  if (busy_) {
    SetError(err, ErrorKind::kBusy, "conversation is already processing a request");
    return false;
  }
  if (history_.empty() || history_.back().kind == MessageKind::kResponse) {
    SetError(err, ErrorKind::kAlreadyResolved, "nothing to resume");
    return false;
  }
  return true;
}

bool ConversationAgent::CheckCanChat(Error* err) const {
  std::lock_guard<std::mutex> lock(mu_);
  return CheckCanChatLocked(err);
}

bool ConversationAgent::CheckCanPermit(const PermitDecision& decision, Error* err) const {
  std::lock_guard<std::mutex> lock(mu_);
  return CheckCanPermitLocked(decision, err);
}

bool ConversationAgent::CheckCanResume(Error* err) const {
  std::lock_guard<std::mutex> lock(mu_);
  return CheckCanResumeLocked(err);
}

void ConversationAgent::Release() {
  std::lock_guard<std::mutex> lock(mu_);
  busy_ = false;
}

ToolCatalog ConversationAgent::CurrentCatalog() {
  if (!tools_) return ToolCatalog();
  tools_->EnsureInitialized();
  return tools_->Catalog();
}

bool ConversationAgent::Chat(const std::string& prompt,
                             const ModelSettings& settings,
                             const StreamEventCallback& on_event,
                             Error* err) {
  std::vector<ModelMessage> messages;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!CheckCanChatLocked(err)) return false;
    busy_ = true;
    ModelMessage req;
    req.kind = MessageKind::kRequest;
    req.timestamp_ms = NowMillis();
    if (history_.empty() && !system_prompt_.empty()) req.parts.push_back(MakeSystemPromptPart(system_prompt_));
    req.parts.push_back(MakeUserPromptPart(prompt));
    history_.push_back(std::move(req));
    messages = history_;
  }
  return RunModel(std::move(messages), CurrentCatalog(), settings, on_event, err);
}

bool ConversationAgent::PermitAndRun(const PermitDecision& decision,
                                     const ModelSettings& settings,
                                     const StreamEventCallback& on_event,
                                     Error* err) {
  std::vector<MessagePart> selected;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!CheckCanPermitLocked(decision, err)) return false;
    busy_ = true;
    const std::set<std::string> ids(decision.tool_call_ids.begin(), decision.tool_call_ids.end());
    for (const auto& call : ToolCallParts(history_.back())) {
      auto edited = std::find_if(decision.edited_calls.begin(), decision.edited_calls.end(),
                                 [&](const MessagePart& p) { return p.tool_call_id == call.tool_call_id; });
      if (edited != decision.edited_calls.end()) {
        auto part = call;
        part.args = edited->args.is_null() ? nlohmann::json::object() : edited->args;
        selected.push_back(std::move(part));
      } else if (decision.run_all || ids.count(call.tool_call_id)) {
        selected.push_back(call);
      }
    }
  }

  auto catalog = CurrentCatalog();
  auto returns = ExecuteToolCalls(selected, catalog, on_event);

  std::vector<ModelMessage> messages;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!returns.empty()) {
      ModelMessage req;
      req.kind = MessageKind::kRequest;
      req.timestamp_ms = NowMillis();
      req.parts = std::move(returns);
      history_.push_back(std::move(req));
    }
    messages = history_;
  }
  return RunModel(std::move(messages), catalog, settings, on_event, err);
}

bool ConversationAgent::Resume(const ModelSettings& settings, const StreamEventCallback& on_event, Error* err) {
  std::vector<ModelMessage> messages;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!CheckCanResumeLocked(err)) return false;
    busy_ = true;
    messages = history_;
  }
  return RunModel(std::move(messages), CurrentCatalog(), settings, on_event, err);
}

std::vector<MessagePart> ConversationAgent::ExecuteToolCalls(const std::vector<MessagePart>& calls,
                                                             const ToolCatalog& catalog,
                                                             const StreamEventCallback& on_event) {
  std::vector<std::future<MessagePart>> futures;
  futures.reserve(calls.size());
  for (const auto& call : calls) {
    std::cout << "[tool-call] id=" << call.tool_call_id << " name=" << call.tool_name
              << " arguments=" << TruncateForLog(SanitizeJsonForLog(call.args), 2000) << "\n";
    futures.push_back(std::async(std::launch::async, [this, &call, &catalog]() { return ExecuteOne(call, catalog); }));
  }
  // futures[i] belongs to calls[i], whatever order they finish in.
  std::vector<MessagePart> returns;
  returns.reserve(calls.size());
  for (size_t i = 0; i < futures.size(); i++) {
    auto part = futures[i].get();
    std::cout << "[tool-result] id=" << part.tool_call_id << " name=" << part.tool_name
              << " is_error=" << (IsErrorResult(part.result) ? 1 : 0) << "\n";
    if (on_event) {
      StreamEvent ev;
      ev.kind = StreamEventKind::kToolReturn;
      ev.index = static_cast<int>(i);
      ev.part = part;
      on_event(ev);
    }
    returns.push_back(std::move(part));
  }
  return returns;
}

MessagePart ConversationAgent::ExecuteOne(const MessagePart& call, const ToolCatalog& catalog) {
  auto ref = catalog.Resolve(call.tool_name);
  if (!ref || !tools_) {
    return MakeToolReturnPart(call.tool_name, call.tool_call_id, ErrorToolResult("tool not found: " + call.tool_name));
  }
  Error e;
  auto result = tools_->Call(ref->server, ref->tool, call.args, &e);
  if (!result) {
    return MakeToolReturnPart(call.tool_name, call.tool_call_id,
                              ErrorToolResult(std::string(ErrorKindName(e.kind)) + ": " + e.message));
  }
  return MakeToolReturnPart(call.tool_name, call.tool_call_id, std::move(*result));
}

bool ConversationAgent::RunModel(std::vector<ModelMessage> messages,
                                 const ToolCatalog& catalog,
                                 const ModelSettings& settings,
                                 const StreamEventCallback& on_event,
                                 Error* err) {
  if (!engine_) {
    Release();
    SetError(err, ErrorKind::kUpstream, "no model engine configured");
    return false;
  }
  ModelStreamResult result;
  std::string engine_err;
  if (!engine_->RequestStream(messages, catalog.Schemas(), settings, on_event, &result, &engine_err)) {
    std::cout << "[agent] model request failed: " << engine_err << "\n";
    Release();
    SetError(err, ErrorKind::kUpstream, engine_err.empty() ? "model request failed" : engine_err);
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  result.response.kind = MessageKind::kResponse;
  if (result.response.timestamp_ms == 0) result.response.timestamp_ms = NowMillis();
  history_.push_back(result.response);
  last_response_ = result.response;
  auto delta = result.usage;
  delta.requests = 0;
  usage_.Incr(delta, 1);
  busy_ = false;
  return true;
}

std::vector<ModelMessage> ConversationAgent::AllMessages() const {
  std::lock_guard<std::mutex> lock(mu_);
  return history_;
}

Usage ConversationAgent::GetUsage() const {
  std::lock_guard<std::mutex> lock(mu_);
  return usage_;
}

std::optional<ModelMessage> ConversationAgent::LastResponse() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_response_;
}

std::vector<MessagePart> ConversationAgent::PendingToolCalls() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (history_.empty()) return {};
  return ToolCallParts(history_.back());
}

AgentState ConversationAgent::State() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (busy_) return AgentState::kAwaitingModel;
  if (EndsWithPendingCalls(history_)) return AgentState::kAwaitingPermission;
  return AgentState::kIdle;
}

}  // namespace floword
