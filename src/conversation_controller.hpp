#pragma once

#include "conversation_agent.hpp"
#include "conversation_store.hpp"
#include "errors.hpp"
#include "event_stream.hpp"
#include "mcp_manager.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace floword {

struct ChatParams {
  std::string prompt;
  // Only used when the conversation has no turns yet. Empty falls back to the default prompt.
  std::string system_prompt;
  std::optional<std::vector<ModelMessage>> redacted_messages;
  ModelSettings settings;
};

struct PermitParams {
  PermitDecision decision;
  std::optional<std::vector<ModelMessage>> redacted_messages;
  ModelSettings settings;
};

// Runs conversation exchanges in the background and publishes their events into the stream registry. State
// conflicts are reported synchronously, before any stream exists.
class ConversationController {
 public:
  ConversationController(ConversationStore* store,
                         McpManager* tools,
                         IModelEngine* engine,
                         StreamRegistry* streams,
                         std::string default_system_prompt);
  ~ConversationController();

  ConversationRecord Create(const std::string& user_id);
  std::optional<ConversationPage> List(const ListQuery& query, Error* err);
  std::optional<ConversationRecord> Info(const std::string& user_id, const std::string& conversation_id, Error* err);
  bool Delete(const std::string& user_id, const std::string& conversation_id, Error* err);

  // Each returns the id of the stream the exchange writes to.
  std::optional<std::string> Chat(const std::string& user_id,
                                  const std::string& conversation_id,
                                  const ChatParams& params,
                                  Error* err);
  std::optional<std::string> Permit(const std::string& user_id,
                                    const std::string& conversation_id,
                                    const PermitParams& params,
                                    Error* err);
  std::optional<std::string> Resume(const std::string& user_id,
                                    const std::string& conversation_id,
                                    const ModelSettings& settings,
                                    Error* err);

  nlohmann::json ToolServers() const;

  // Rejects new exchanges and waits for the running ones.
  void Shutdown();
  size_t InFlight() const;

 private:
  using ExchangeFn = std::function<bool(ConversationAgent& agent, const StreamEventCallback& on_event, Error* err)>;
  // Builds the agent from the stored record and checks the requested transition. Returns null on conflict.
  using PrepareFn = std::function<std::shared_ptr<ConversationAgent>(const ConversationRecord& record, Error* err)>;

  std::optional<ConversationRecord> LoadOwned(const std::string& user_id,
                                              const std::string& conversation_id,
                                              Error* err);
  std::shared_ptr<ConversationAgent> Hydrate(const ConversationRecord& record,
                                             const std::optional<std::vector<ModelMessage>>& redacted_messages,
                                             const std::string& system_prompt);
  bool Reserve(const std::string& conversation_id, Error* err);
  void Release(const std::string& conversation_id);
  std::optional<std::string> StartExchange(const std::string& user_id,
                                           const std::string& conversation_id,
                                           const PrepareFn& prepare,
                                           ExchangeFn run,
                                           Error* err);
  void RunExchange(const std::string& conversation_id,
                   const std::shared_ptr<ConversationAgent>& agent,
                   const std::shared_ptr<EventStream>& stream,
                   const ExchangeFn& run);
  void ReapFinishedLocked();

  ConversationStore* store_;
  McpManager* tools_;
  IModelEngine* engine_;
  StreamRegistry* streams_;
  const std::string default_system_prompt_;

  mutable std::mutex mu_;
  std::set<std::string> in_flight_;
  std::vector<std::future<void>> tasks_;
  bool shutting_down_ = false;
};

}  // namespace floword
