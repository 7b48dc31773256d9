#include "conversation_controller.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace floword {

ConversationController::ConversationController(ConversationStore* store,
                                               McpManager* tools,
                                               IModelEngine* engine,
                                               StreamRegistry* streams,
                                               std::string default_system_prompt)
    : store_(store), tools_(tools), engine_(engine), streams_(streams),
      default_system_prompt_(std::move(default_system_prompt)) {}

ConversationController::~ConversationController() { Shutdown(); }

ConversationRecord ConversationController::Create(const std::string& user_id) {
  auto r = store_->Create(user_id);
  std::cout << "[conversation] created id=" << r.conversation_id << " user=" << user_id << "\n";
  return r;
}

std::optional<ConversationPage> ConversationController::List(const ListQuery& query, Error* err) {
  return store_->List(query, err);
}

std::optional<ConversationRecord> ConversationController::LoadOwned(const std::string& user_id,
                                                                    const std::string& conversation_id,
                                                                    Error* err) {
  auto r = store_->Get(conversation_id, err);
  if (!r) return std::nullopt;
  if (r->user_id != user_id) {
    SetError(err, ErrorKind::kForbidden, "conversation belongs to another user");
    return std::nullopt;
  }
  return r;
}

std::optional<ConversationRecord> ConversationController::Info(const std::string& user_id,
                                                               const std::string& conversation_id,
                                                               Error* err) {
  return LoadOwned(user_id, conversation_id, err);
}

bool ConversationController::Delete(const std::string& user_id, const std::string& conversation_id, Error* err) {
  if (!Reserve(conversation_id, err)) return false;
  const bool ok = LoadOwned(user_id, conversation_id, err) && store_->Delete(conversation_id, err);
  Release(conversation_id);
  if (!ok) return false;
  std::cout << "[conversation] deleted id=" << conversation_id << "\n";
  return true;
}

std::shared_ptr<ConversationAgent> ConversationController::Hydrate(
    const ConversationRecord& record,
    const std::optional<std::vector<ModelMessage>>& redacted_messages,
    const std::string& system_prompt) {
  auto history = redacted_messages ? *redacted_messages : record.messages;
  return std::make_shared<ConversationAgent>(engine_, tools_,
                                             system_prompt.empty() ? default_system_prompt_ : system_prompt,
                                             std::move(history), record.usage);
}

std::optional<std::string> ConversationController::Chat(const std::string& user_id,
                                                        const std::string& conversation_id,
                                                        const ChatParams& params,
                                                        Error* err) {
  if (params.prompt.empty()) {
    SetError(err, ErrorKind::kInvalidRequest, "prompt must not be empty");
    return std::nullopt;
  }
  const auto prompt = params.prompt;
  const auto settings = params.settings;
  return StartExchange(
      user_id, conversation_id,
      [this, &params](const ConversationRecord& record, Error* e) -> std::shared_ptr<ConversationAgent> {
        auto agent = Hydrate(record, params.redacted_messages, params.system_prompt);
        if (!agent->CheckCanChat(e)) return nullptr;
        return agent;
      },
      [prompt, settings](ConversationAgent& a, const StreamEventCallback& on_event, Error* e) {
        return a.Chat(prompt, settings, on_event, e);
      },
      err);
}

std::optional<std::string> ConversationController::Permit(const std::string& user_id,
                                                          const std::string& conversation_id,
                                                          const PermitParams& params,
                                                          Error* err) {
  const auto decision = params.decision;
  const auto settings = params.settings;
  return StartExchange(
      user_id, conversation_id,
      [this, &params](const ConversationRecord& record, Error* e) -> std::shared_ptr<ConversationAgent> {
        auto agent = Hydrate(record, params.redacted_messages, "");
        if (!agent->CheckCanPermit(params.decision, e)) return nullptr;
        return agent;
      },
      [decision, settings](ConversationAgent& a, const StreamEventCallback& on_event, Error* e) {
        return a.PermitAndRun(decision, settings, on_event, e);
      },
      err);
}

std::optional<std::string> ConversationController::Resume(const std::string& user_id,
                                                          const std::string& conversation_id,
                                                          const ModelSettings& settings,
                                                          Error* err) {
  return StartExchange(
      user_id, conversation_id,
      [this](const ConversationRecord& record, Error* e) -> std::shared_ptr<ConversationAgent> {
        auto agent = Hydrate(record, std::nullopt, "");
        if (!agent->CheckCanResume(e)) return nullptr;
        return agent;
      },
      [settings](ConversationAgent& a, const StreamEventCallback& on_event, Error* e) {
        return a.Resume(settings, on_event, e);
      },
      err);
}

bool ConversationController::Reserve(const std::string& conversation_id, Error* err) {
  std::lock_guard<std::mutex> lock(mu_);
  ReapFinishedLocked();
  if (shutting_down_) {
    SetError(err, ErrorKind::kBusy, "server is shutting down");
    return false;
  }
  if (!in_flight_.insert(conversation_id).second) {
    SetError(err, ErrorKind::kBusy, "conversation is already processing a request");
    return false;
  }
  return true;
}

void ConversationController::Release(const std::string& conversation_id) {
  std::lock_guard<std::mutex> lock(mu_);
  in_flight_.erase(conversation_id);
}

// The conversation is reserved before its record is read, so a second request can never run on history that an
// earlier exchange is about to replace.
std::optional<std::string> ConversationController::StartExchange(const std::string& user_id,
                                                                 const std::string& conversation_id,
                                                                 const PrepareFn& prepare,
                                                                 ExchangeFn run,
                                                                 Error* err) {
  if (!Reserve(conversation_id, err)) return std::nullopt;
  auto record = LoadOwned(user_id, conversation_id, err);
  std::shared_ptr<ConversationAgent> agent;
  if (record) agent = prepare(*record, err);
  if (!agent) {
    Release(conversation_id);
    return std::nullopt;
  }

  const auto stream_id = NewId("stream");
  auto stream = streams_->Create(stream_id, err);
  if (!stream) {
    Release(conversation_id);
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mu_);
  if (shutting_down_) {
    in_flight_.erase(conversation_id);
    streams_->Delete(stream_id);
    SetError(err, ErrorKind::kBusy, "server is shutting down");
    return std::nullopt;
  }
  std::cout << "[conversation] exchange started id=" << conversation_id << " stream=" << stream_id << "\n";
  tasks_.push_back(std::async(std::launch::async, [this, conversation_id, agent, stream, run]() {
    RunExchange(conversation_id, agent, stream, run);
  }));
  return stream_id;
}

void ConversationController::RunExchange(const std::string& conversation_id,
                                         const std::shared_ptr<ConversationAgent>& agent,
                                         const std::shared_ptr<EventStream>& stream,
                                         const ExchangeFn& run) {
  auto on_event = [&stream](const StreamEvent& ev) {
    stream->AddEvent(StreamEventToJson(ev));
    return true;
  };
  Error e;
  bool ok = false;
  try {
    ok = run(*agent, on_event, &e);
  } catch (const std::exception& ex) {
    e = Error{ErrorKind::kUpstream, std::string("exchange failed: ") + ex.what()};
  }

  // A failed model call still leaves the submitted request turn in history, so the conversation can be resumed.
  Error store_err;
  if (!store_->Update(conversation_id, agent->AllMessages(), agent->GetUsage(), &store_err)) {
    std::cout << "[conversation] persist failed id=" << conversation_id << ": " << store_err.message << "\n";
    if (ok) {
      ok = false;
      e = store_err;
    }
  }
  if (!ok) {
    std::cout << "[conversation] exchange failed id=" << conversation_id << " type=" << ErrorKindName(e.kind) << ": "
              << e.message << "\n";
    stream->AddEvent(ErrorEventJson(e));
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_.erase(conversation_id);
  }
  stream->MarkCompleted();
  std::cout << "[stream] id=" << stream->Id() << " completed events=" << stream->Size() << "\n";
}

void ConversationController::ReapFinishedLocked() {
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      it->get();
      it = tasks_.erase(it);
    } else {
      ++it;
    }
  }
}

nlohmann::json ConversationController::ToolServers() const {
  if (!tools_) return {{"initialized", false}, {"servers", nlohmann::json::array()}};
  return tools_->DescribeJson();
}

void ConversationController::Shutdown() {
  std::vector<std::future<void>> tasks;
  {
    std::lock_guard<std::mutex> lock(mu_);
    shutting_down_ = true;
    tasks.swap(tasks_);
  }
  for (auto& t : tasks) t.get();
}

size_t ConversationController::InFlight() const {
  std::lock_guard<std::mutex> lock(mu_);
  return in_flight_.size();
}

}  // namespace floword
