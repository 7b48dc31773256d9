#include "conversation_store.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <set>
#include <thread>

using namespace floword;
using namespace floword::testutil;

namespace {

std::vector<ModelMessage> OneTurn(const std::string& prompt) {
  ModelMessage req;
  req.kind = MessageKind::kRequest;
  req.parts = {MakeUserPromptPart(prompt)};
  return {req};
}

}  // namespace

TEST(MemoryConversationStoreTest, CreateGetUpdateDelete) {
  MemoryConversationStore store;
  auto r = store.Create("alice");
  EXPECT_FALSE(r.conversation_id.empty());
  EXPECT_EQ(r.title, "Untitled");
  EXPECT_EQ(r.created_at, r.updated_at);

  Error err;
  Usage usage;
  usage.requests = 1;
  ASSERT_TRUE(store.Update(r.conversation_id, OneTurn("hi"), usage, &err));
  ASSERT_TRUE(store.Update(r.conversation_id, OneTurn("hi"), usage, &err));
  auto got = store.Get(r.conversation_id, &err);
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->messages.size(), 1u);
  EXPECT_EQ(got->usage.requests, 1);
  EXPECT_GE(got->updated_at, r.updated_at + 2);

  ASSERT_TRUE(store.Delete(r.conversation_id, &err));
  EXPECT_FALSE(store.Get(r.conversation_id, &err).has_value());
  EXPECT_EQ(err.kind, ErrorKind::kConversationNotFound);
  EXPECT_FALSE(store.Delete(r.conversation_id, &err));
  EXPECT_FALSE(store.Update(r.conversation_id, {}, usage, &err));
  EXPECT_EQ(err.kind, ErrorKind::kConversationNotFound);
}

TEST(MemoryConversationStoreTest, ListIsPerUserOrderedAndPaged) {
  MemoryConversationStore store;
  std::vector<std::string> ids;
  for (int i = 0; i < 5; i++) {
    ids.push_back(store.Create("alice").conversation_id);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  store.Create("bob");

  Error err;
  ListQuery q;
  q.user_id = "alice";
  auto page = store.List(q, &err);
  ASSERT_TRUE(page.has_value());
  ASSERT_EQ(page->items.size(), 5u);
  EXPECT_EQ(page->items.front().conversation_id, ids.back());
  EXPECT_FALSE(page->has_more);

  q.order = "asc";
  q.limit = 2;
  q.offset = 1;
  page = store.List(q, &err);
  ASSERT_TRUE(page.has_value());
  ASSERT_EQ(page->items.size(), 2u);
  EXPECT_EQ(page->items[0].conversation_id, ids[1]);
  EXPECT_EQ(page->items[1].conversation_id, ids[2]);
  EXPECT_TRUE(page->has_more);

  // Touching the oldest moves it to the front when ordered by updated_at.
  ASSERT_TRUE(store.Update(ids[0], OneTurn("x"), Usage{}, &err));
  q = ListQuery{};
  q.user_id = "alice";
  q.order_by = "updated_at";
  page = store.List(q, &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_EQ(page->items.front().conversation_id, ids[0]);

  q.user_id = "carol";
  page = store.List(q, &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_TRUE(page->items.empty());
}

TEST(MemoryConversationStoreTest, ListRejectsBadQueries) {
  MemoryConversationStore store;
  Error err;
  ListQuery q;
  q.order = "sideways";
  EXPECT_FALSE(store.List(q, &err).has_value());
  EXPECT_EQ(err.kind, ErrorKind::kInvalidRequest);
  q = ListQuery{};
  q.order_by = "title";
  EXPECT_FALSE(store.List(q, &err).has_value());
  q = ListQuery{};
  q.limit = -1;
  EXPECT_FALSE(store.List(q, &err).has_value());
  q = ListQuery{};
  q.limit = 0;
  EXPECT_FALSE(store.List(q, &err).has_value());
  EXPECT_EQ(err.kind, ErrorKind::kInvalidRequest);
  q = ListQuery{};
  q.offset = -3;
  EXPECT_FALSE(store.List(q, &err).has_value());
}

TEST(MemoryConversationStoreTest, HasMoreStopsAtTheLastPage) {
  MemoryConversationStore store;
  for (int i = 0; i < 4; i++) store.Create("alice");

  Error err;
  ListQuery q;
  q.user_id = "alice";
  q.limit = 2;
  auto page = store.List(q, &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_EQ(page->items.size(), 2u);
  EXPECT_TRUE(page->has_more);

  // A full last page does not promise more.
  q.offset = 2;
  page = store.List(q, &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_EQ(page->items.size(), 2u);
  EXPECT_FALSE(page->has_more);

  q.offset = 10;
  page = store.List(q, &err);
  ASSERT_TRUE(page.has_value());
  EXPECT_TRUE(page->items.empty());
  EXPECT_FALSE(page->has_more);
}

TEST(ConversationRecordTest, ListingOmitsMessages) {
  ConversationRecord r;
  r.conversation_id = "c1";
  r.user_id = "alice";
  r.messages = OneTurn("hi");
  EXPECT_TRUE(RecordToJson(r, false)["messages"].is_null());
  EXPECT_EQ(RecordToJson(r, true)["messages"].size(), 1u);
  EXPECT_FALSE(RecordToJson(r, true).contains("user_id"));

  std::string err;
  EXPECT_FALSE(RecordFromJson({{"title", "no id"}}, &err).has_value());
}

TEST(FileConversationStoreTest, SurvivesRestart) {
  TempPath path("floword-store");
  std::string id;
  {
    FileConversationStore store(path.str());
    id = store.Create("alice").conversation_id;
    Usage usage;
    usage.requests = 2;
    Error err;
    ASSERT_TRUE(store.Update(id, OneTurn("remember me"), usage, &err));
    store.Create("bob");
  }
  FileConversationStore reopened(path.str());
  Error err;
  auto r = reopened.Get(id, &err);
  ASSERT_TRUE(r.has_value()) << err.message;
  EXPECT_EQ(r->user_id, "alice");
  EXPECT_EQ(r->usage.requests, 2);
  ASSERT_EQ(r->messages.size(), 1u);
  EXPECT_EQ(r->messages[0].parts[0].content, "remember me");

  ListQuery q;
  q.user_id = "bob";
  EXPECT_EQ(reopened.List(q, &err)->items.size(), 1u);
}

TEST(FileConversationStoreTest, IgnoresUnreadableSnapshot) {
  TempPath path("floword-store-bad");
  {
    std::ofstream f(path.str());
    f << "{ not json";
  }
  FileConversationStore store(path.str());
  auto r = store.Create("alice");
  Error err;
  EXPECT_TRUE(store.Get(r.conversation_id, &err).has_value());
}

TEST(FileConversationStoreTest, ReportsAndRollsBackFailedWrites) {
  // A regular file where the snapshot directory should be makes every write fail.
  TempPath blocker("floword-store-blocker");
  {
    std::ofstream f(blocker.str());
    f << "not a directory";
  }
  FileConversationStore store(blocker.str() + "/conversations.json");
  auto r = store.Create("alice");

  Usage usage;
  usage.requests = 1;
  Error err;
  EXPECT_FALSE(store.Update(r.conversation_id, OneTurn("lost"), usage, &err));
  EXPECT_EQ(err.kind, ErrorKind::kStorage);
  EXPECT_FALSE(err.message.empty());

  auto got = store.Get(r.conversation_id, &err);
  ASSERT_TRUE(got.has_value());
  EXPECT_TRUE(got->messages.empty());
  EXPECT_EQ(got->usage.requests, 0);

  err = Error{};
  EXPECT_FALSE(store.Delete(r.conversation_id, &err));
  EXPECT_EQ(err.kind, ErrorKind::kStorage);
  EXPECT_TRUE(store.Get(r.conversation_id, &err).has_value());
}

TEST(ConversationStoreFactoryTest, PicksBackendFromConfig) {
  TempPath path("floword-store-factory");
  RuntimeConfig cfg;
  auto memory = MakeConversationStore(cfg);
  EXPECT_NE(dynamic_cast<MemoryConversationStore*>(memory.get()), nullptr);
  EXPECT_EQ(dynamic_cast<FileConversationStore*>(memory.get()), nullptr);

  cfg.conversation_store_type = "file";
  cfg.conversation_store_path = path.str();
  auto file = MakeConversationStore(cfg);
  EXPECT_NE(dynamic_cast<FileConversationStore*>(file.get()), nullptr);
}
