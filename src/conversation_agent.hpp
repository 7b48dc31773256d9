#pragma once

#include "errors.hpp"
#include "mcp_manager.hpp"
#include "messages.hpp"
#include "providers/provider.hpp"
#include "tooling.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace floword {

enum class AgentState {
  kIdle,
  kAwaitingModel,
  kAwaitingPermission,
};

const char* AgentStateName(AgentState state);

// Which pending tool calls to run. run_all wins over a narrower id list. Edited calls replace the arguments of the
// pending call with the same id and select it.
struct PermitDecision {
  bool run_all = false;
  std::vector<std::string> tool_call_ids;
  std::vector<MessagePart> edited_calls;
};

// One conversation's history and usage. At most one model exchange runs at a time; a second concurrent call fails
// with kBusy. The model engine and the tool registry are borrowed and must outlive the agent.
class ConversationAgent {
 public:
  ConversationAgent(IModelEngine* engine,
                    McpManager* tools,
                    std::string system_prompt,
                    std::vector<ModelMessage> history = {},
                    Usage usage = {});

  bool Chat(const std::string& prompt, const ModelSettings& settings, const StreamEventCallback& on_event, Error* err);
  bool PermitAndRun(const PermitDecision& decision,
                    const ModelSettings& settings,
                    const StreamEventCallback& on_event,
                    Error* err);
  // Re-issues the model request for a history that ends in a request turn.
  bool Resume(const ModelSettings& settings, const StreamEventCallback& on_event, Error* err);

  bool CheckCanChat(Error* err) const;
  bool CheckCanPermit(const PermitDecision& decision, Error* err) const;
  bool CheckCanResume(Error* err) const;

  std::vector<ModelMessage> AllMessages() const;
  Usage GetUsage() const;
  std::optional<ModelMessage> LastResponse() const;
  std::vector<MessagePart> PendingToolCalls() const;
  AgentState State() const;

 private:
  bool CheckCanChatLocked(Error* err) const;
  bool CheckCanPermitLocked(const PermitDecision& decision, Error* err) const;
  bool CheckCanResumeLocked(Error* err) const;
  void Release();

  std::vector<MessagePart> ExecuteToolCalls(const std::vector<MessagePart>& calls,
                                            const ToolCatalog& catalog,
                                            const StreamEventCallback& on_event);
  MessagePart ExecuteOne(const MessagePart& call, const ToolCatalog& catalog);
  bool RunModel(std::vector<ModelMessage> messages,
                const ToolCatalog& catalog,
                const ModelSettings& settings,
                const StreamEventCallback& on_event,
                Error* err);
  ToolCatalog CurrentCatalog();

  IModelEngine* engine_;
  McpManager* tools_;
  const std::string system_prompt_;

  mutable std::mutex mu_;
  std::vector<ModelMessage> history_;
  Usage usage_;
  std::optional<ModelMessage> last_response_;
  bool busy_ = false;
};

}  // namespace floword
