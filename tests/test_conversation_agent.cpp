#include "conversation_agent.hpp"
#include "providers/test_model.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <future>
#include <mutex>
#include <thread>

using namespace floword;
using namespace floword::testutil;

namespace {

// Collects events from any thread.
struct EventLog {
  std::mutex mu;
  std::vector<StreamEvent> events;

  StreamEventCallback Callback() {
    return [this](const StreamEvent& ev) {
      std::lock_guard<std::mutex> lock(mu);
      events.push_back(ev);
      return true;
    };
  }

  std::vector<StreamEvent> OfKind(StreamEventKind kind) {
    std::lock_guard<std::mutex> lock(mu);
    std::vector<StreamEvent> out;
    for (const auto& e : events) {
      if (e.kind == kind) out.push_back(e);
    }
    return out;
  }
};

class ConversationAgentTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fs_ = MakeFsServer();
    tools_ = MakeFakeManager({{"fs", fs_}});
    ASSERT_TRUE(tools_);
  }

  std::shared_ptr<FakeServer> fs_;
  std::unique_ptr<McpManager> tools_;
  TestModelEngine engine_;
  ModelSettings settings_;
};

}  // namespace

TEST_F(ConversationAgentTest, ChatWithoutToolsAnswersText) {
  auto empty = McpManager::FromJson(nlohmann::json::object(), nullptr, nullptr);
  ConversationAgent agent(&engine_, empty.get(), "be helpful");
  EventLog log;
  Error err;
  ASSERT_TRUE(agent.Chat("hello", settings_, log.Callback(), &err)) << err.message;

  auto history = agent.AllMessages();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].kind, MessageKind::kRequest);
  ASSERT_EQ(history[0].parts.size(), 2u);
  EXPECT_EQ(history[0].parts[0].kind, PartKind::kSystemPrompt);
  EXPECT_EQ(history[0].parts[1].content, "hello");
  EXPECT_EQ(TextContent(history[1]), "success (no tool calls)");
  EXPECT_EQ(agent.State(), AgentState::kIdle);
  EXPECT_EQ(agent.GetUsage().requests, 1);
  EXPECT_GT(agent.GetUsage().total_tokens, 0);
  ASSERT_TRUE(agent.LastResponse().has_value());

  // The streamed pieces add up to the final text.
  std::string streamed;
  for (const auto& e : log.events) {
    streamed += e.kind == StreamEventKind::kPartStart ? e.part.content : e.delta.content_delta;
  }
  EXPECT_EQ(streamed, "success (no tool calls)");

  // The system prompt is only added to the first turn.
  ASSERT_TRUE(agent.Chat("again", settings_, nullptr, &err));
  EXPECT_EQ(agent.AllMessages()[2].parts.size(), 1u);
  EXPECT_EQ(agent.GetUsage().requests, 2);
}

TEST_F(ConversationAgentTest, ListFilesScenario) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  EventLog log;
  Error err;
  ASSERT_TRUE(agent.Chat("list files", settings_, log.Callback(), &err)) << err.message;

  EXPECT_EQ(agent.State(), AgentState::kAwaitingPermission);
  auto pending = agent.PendingToolCalls();
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].tool_name, "fs-list_files");
  EXPECT_EQ(pending[0].args["path"], "a");
  EXPECT_TRUE(fs_->Calls().empty());
  auto announced = log.OfKind(StreamEventKind::kPartStart);
  ASSERT_FALSE(announced.empty());
  EXPECT_EQ(announced[0].part.tool_name, "fs-list_files");

  PermitDecision decision;
  decision.tool_call_ids = {pending[0].tool_call_id};
  ASSERT_TRUE(agent.PermitAndRun(decision, settings_, log.Callback(), &err)) << err.message;

  ASSERT_EQ(fs_->Calls().size(), 1u);
  EXPECT_EQ(fs_->Calls()[0].first, "list_files");
  auto history = agent.AllMessages();
  ASSERT_EQ(history.size(), 4u);
  ASSERT_EQ(history[2].kind, MessageKind::kRequest);
  ASSERT_EQ(history[2].parts.size(), 1u);
  EXPECT_EQ(history[2].parts[0].kind, PartKind::kToolReturn);
  EXPECT_EQ(history[2].parts[0].tool_call_id, pending[0].tool_call_id);
  EXPECT_EQ(history[3].kind, MessageKind::kResponse);
  EXPECT_FALSE(HasToolCalls(history[3]));
  EXPECT_NE(TextContent(history[3]).find("a.txt"), std::string::npos);
  EXPECT_EQ(agent.GetUsage().requests, 2);
  EXPECT_EQ(agent.State(), AgentState::kIdle);
  EXPECT_EQ(log.OfKind(StreamEventKind::kToolReturn).size(), 1u);
}

TEST_F(ConversationAgentTest, ChatWithPendingCallsNeedsPermission) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  Error err;
  ASSERT_TRUE(agent.Chat("list files", settings_, nullptr, &err));
  const auto before = MessagesToJson(agent.AllMessages());

  EXPECT_FALSE(agent.CheckCanChat(&err));
  EXPECT_FALSE(agent.Chat("and now?", settings_, nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kNeedsPermission);
  EXPECT_EQ(MessagesToJson(agent.AllMessages()), before);
  EXPECT_EQ(engine_.RequestCount(), 1);
}

TEST_F(ConversationAgentTest, PermitWithoutPendingCallsIsAlreadyResolved) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  Error err;
  EXPECT_FALSE(agent.PermitAndRun(PermitDecision{true, {}, {}}, settings_, nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kAlreadyResolved);

  ASSERT_TRUE(agent.Chat("list files", settings_, nullptr, &err));
  ASSERT_TRUE(agent.PermitAndRun(PermitDecision{true, {}, {}}, settings_, nullptr, &err));
  EXPECT_FALSE(agent.PermitAndRun(PermitDecision{true, {}, {}}, settings_, nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kAlreadyResolved);
}

TEST_F(ConversationAgentTest, PermitRejectsUnknownIds) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  Error err;
  ASSERT_TRUE(agent.Chat("list files", settings_, nullptr, &err));
  PermitDecision decision;
  decision.tool_call_ids = {"not-a-call"};
  EXPECT_FALSE(agent.PermitAndRun(decision, settings_, nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kInvalidRequest);
  EXPECT_EQ(agent.State(), AgentState::kAwaitingPermission);
}

TEST_F(ConversationAgentTest, ExecuteAllRunsEveryPendingCall) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  EventLog log;
  Error err;
  ASSERT_TRUE(agent.Chat("list files", settings_, nullptr, &err));
  auto pending = agent.PendingToolCalls();
  ASSERT_TRUE(agent.PermitAndRun(PermitDecision{true, {}, {}}, settings_, log.Callback(), &err)) << err.message;

  EXPECT_EQ(fs_->CallCount("list_files"), 1u);
  EXPECT_EQ(fs_->CallCount("read_file"), 1u);
  auto returns = agent.AllMessages()[2].parts;
  ASSERT_EQ(returns.size(), 2u);
  EXPECT_EQ(returns[0].tool_call_id, pending[0].tool_call_id);
  EXPECT_EQ(returns[1].tool_call_id, pending[1].tool_call_id);
  auto events = log.OfKind(StreamEventKind::kToolReturn);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].part.tool_call_id, pending[0].tool_call_id);
}

TEST_F(ConversationAgentTest, ExecuteByIdRunsOnlyTheSelectedCall) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  Error err;
  ASSERT_TRUE(agent.Chat("read", settings_, nullptr, &err));
  auto pending = agent.PendingToolCalls();
  ASSERT_EQ(pending.size(), 2u);

  PermitDecision decision;
  decision.tool_call_ids = {pending[1].tool_call_id};
  ASSERT_TRUE(agent.PermitAndRun(decision, settings_, nullptr, &err)) << err.message;

  auto calls = fs_->Calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].first, "read_file");
  EXPECT_EQ(fs_->CallCount("list_files"), 0u);
  auto history = agent.AllMessages();
  ASSERT_EQ(history.size(), 4u);
  ASSERT_EQ(history[2].parts.size(), 1u);
  EXPECT_EQ(history[2].parts[0].kind, PartKind::kToolReturn);
  EXPECT_EQ(history[2].parts[0].tool_name, pending[1].tool_name);
  EXPECT_EQ(history[2].parts[0].tool_call_id, pending[1].tool_call_id);
}

TEST_F(ConversationAgentTest, ExecuteAllWithIdsRunsTheUnion) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  Error err;
  ASSERT_TRUE(agent.Chat("read", settings_, nullptr, &err));
  auto pending = agent.PendingToolCalls();
  ASSERT_EQ(pending.size(), 2u);

  PermitDecision decision;
  decision.run_all = true;
  decision.tool_call_ids = {pending[0].tool_call_id};
  ASSERT_TRUE(agent.PermitAndRun(decision, settings_, nullptr, &err)) << err.message;

  EXPECT_EQ(fs_->Calls().size(), 2u);
  EXPECT_EQ(fs_->CallCount("list_files"), 1u);
  EXPECT_EQ(fs_->CallCount("read_file"), 1u);
  auto history = agent.AllMessages();
  ASSERT_EQ(history.size(), 4u);
  ASSERT_EQ(history[2].parts.size(), 2u);
  EXPECT_EQ(history[2].parts[0].tool_call_id, pending[0].tool_call_id);
  EXPECT_EQ(history[2].parts[1].tool_call_id, pending[1].tool_call_id);
}

TEST_F(ConversationAgentTest, ExecuteNoneContinuesWithoutToolTurn) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  Error err;
  ASSERT_TRUE(agent.Chat("list files", settings_, nullptr, &err));
  ASSERT_TRUE(agent.PermitAndRun(PermitDecision{}, settings_, nullptr, &err)) << err.message;
  auto history = agent.AllMessages();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[2].kind, MessageKind::kResponse);
  EXPECT_TRUE(fs_->Calls().empty());
  EXPECT_EQ(agent.GetUsage().requests, 2);
}

TEST_F(ConversationAgentTest, EditedCallsReplaceArguments) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  Error err;
  ASSERT_TRUE(agent.Chat("read", settings_, nullptr, &err));
  auto pending = agent.PendingToolCalls();
  auto edited = pending[1];
  edited.args = {{"path", "README.md"}};
  PermitDecision decision;
  decision.edited_calls = {edited};
  ASSERT_TRUE(agent.PermitAndRun(decision, settings_, nullptr, &err)) << err.message;

  auto calls = fs_->Calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].first, "read_file");
  EXPECT_EQ(calls[0].second["path"], "README.md");
}

TEST_F(ConversationAgentTest, ConcurrentCallsKeepPairingWhenFinishingOutOfOrder) {
  auto srv = std::make_shared<FakeServer>();
  srv->AddTool("slow", [](const nlohmann::json&) { return TextResult("slow result"); }, std::chrono::milliseconds(300));
  srv->AddTool("fast", [](const nlohmann::json&) { return TextResult("fast result"); });
  auto tools = MakeFakeManager({{"work", srv}});

  ModelMessage resp;
  resp.kind = MessageKind::kResponse;
  resp.parts = {MakeToolCallPart("work-slow", {}, "call-slow"), MakeToolCallPart("work-fast", {}, "call-fast")};
  ModelMessage req;
  req.kind = MessageKind::kRequest;
  req.parts = {MakeUserPromptPart("go")};
  ConversationAgent agent(&engine_, tools.get(), "", {req, resp});

  Error err;
  ASSERT_TRUE(agent.PermitAndRun(PermitDecision{true, {}, {}}, settings_, nullptr, &err)) << err.message;
  EXPECT_EQ(srv->max_active.load(), 2);
  auto returns = agent.AllMessages()[2].parts;
  ASSERT_EQ(returns.size(), 2u);
  EXPECT_EQ(returns[0].tool_call_id, "call-slow");
  EXPECT_EQ(returns[0].result["content"][0]["text"], "slow result");
  EXPECT_EQ(returns[1].tool_call_id, "call-fast");
  EXPECT_EQ(returns[1].result["content"][0]["text"], "fast result");
}

TEST_F(ConversationAgentTest, UnknownToolBecomesErrorResult) {
  ModelMessage req;
  req.kind = MessageKind::kRequest;
  req.parts = {MakeUserPromptPart("go")};
  ModelMessage resp;
  resp.kind = MessageKind::kResponse;
  resp.parts = {MakeToolCallPart("ghost-haunt", {}, "c1"), MakeToolCallPart("fs-list_files", {{"path", "."}}, "c2")};
  ConversationAgent agent(&engine_, tools_.get(), "", {req, resp});

  Error err;
  ASSERT_TRUE(agent.PermitAndRun(PermitDecision{true, {}, {}}, settings_, nullptr, &err)) << err.message;
  auto returns = agent.AllMessages()[2].parts;
  ASSERT_EQ(returns.size(), 2u);
  EXPECT_TRUE(IsErrorResult(returns[0].result));
  EXPECT_NE(returns[0].result.dump().find("ghost"), std::string::npos);
  EXPECT_FALSE(IsErrorResult(returns[1].result));
  EXPECT_EQ(agent.State(), AgentState::kIdle);
}

TEST_F(ConversationAgentTest, SecondExchangeWhileBusyFails) {
  BlockingEngine engine;
  ConversationAgent agent(&engine, tools_.get(), "");
  auto first = std::async(std::launch::async, [&]() {
    Error e;
    return agent.Chat("one", settings_, nullptr, &e);
  });
  ASSERT_TRUE(engine.WaitEntered(1));
  EXPECT_EQ(agent.State(), AgentState::kAwaitingModel);

  Error err;
  EXPECT_FALSE(agent.Chat("two", settings_, nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kBusy);
  EXPECT_FALSE(agent.Resume(settings_, nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kBusy);

  engine.Release();
  EXPECT_TRUE(first.get());
  EXPECT_EQ(agent.AllMessages().size(), 2u);
}

TEST_F(ConversationAgentTest, FailedModelCallCanBeResumed) {
  ConversationAgent agent(&engine_, tools_.get(), "");
  engine_.FailNextRequests(1);
  Error err;
  EXPECT_FALSE(agent.Chat("list files", settings_, nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kUpstream);
  EXPECT_EQ(agent.GetUsage().requests, 0);
  auto history = agent.AllMessages();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].kind, MessageKind::kRequest);
  EXPECT_EQ(agent.State(), AgentState::kIdle);

  ASSERT_TRUE(agent.CheckCanResume(&err));
  ASSERT_TRUE(agent.Resume(settings_, nullptr, &err)) << err.message;
  EXPECT_EQ(agent.AllMessages().size(), 2u);
  EXPECT_EQ(agent.GetUsage().requests, 1);
  EXPECT_EQ(agent.State(), AgentState::kAwaitingPermission);

  EXPECT_FALSE(agent.Resume(settings_, nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kAlreadyResolved);
}

TEST_F(ConversationAgentTest, HydratedHistoryKeepsUsageAndLastResponse) {
  ModelMessage req;
  req.kind = MessageKind::kRequest;
  req.parts = {MakeUserPromptPart("hi")};
  ModelMessage resp;
  resp.kind = MessageKind::kResponse;
  resp.parts = {MakeTextPart("hello")};
  Usage usage;
  usage.requests = 3;
  ConversationAgent agent(&engine_, tools_.get(), "ignored for existing history", {req, resp}, usage);
  ASSERT_TRUE(agent.LastResponse().has_value());
  EXPECT_EQ(TextContent(*agent.LastResponse()), "hello");

  Error err;
  ASSERT_TRUE(agent.Chat("more", settings_, nullptr, &err));
  EXPECT_EQ(agent.GetUsage().requests, 4);
  EXPECT_EQ(agent.AllMessages()[2].parts.size(), 1u);
}

TEST(AgentStateTest, Names) {
  EXPECT_STREQ(AgentStateName(AgentState::kIdle), "idle");
  EXPECT_STREQ(AgentStateName(AgentState::kAwaitingPermission), "awaiting_permission");
}
