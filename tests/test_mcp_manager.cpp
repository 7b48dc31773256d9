#include "mcp_manager.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

using namespace floword;
using namespace floword::testutil;

namespace {

bool Contains(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

}  // namespace

TEST(McpManagerTest, PartitionsUsableFailedAndDisabled) {
  auto fs = MakeFsServer();
  auto broken = std::make_shared<FakeServer>();
  broken->fail_initialize = true;
  auto refused = std::make_shared<FakeServer>();
  refused->fail_start = true;

  nlohmann::json cfg = FakeConfig({"fs", "broken", "refused"});
  cfg["mcpServers"]["off"] = {{"command", "never-run"}, {"enabled", false}};
  Error err;
  auto manager = McpManager::FromJson(cfg, FakeFactory({{"fs", fs}, {"broken", broken}, {"refused", refused}}), &err);
  ASSERT_TRUE(manager) << err.message;
  EXPECT_FALSE(manager->IsInitialized());

  manager->Initialize();
  EXPECT_TRUE(manager->IsInitialized());
  EXPECT_EQ(manager->UsableNames(), std::vector<std::string>({"fs"}));
  EXPECT_EQ(manager->DisabledNames(), std::vector<std::string>({"off"}));
  auto failed = manager->FailedServers();
  ASSERT_EQ(failed.size(), 2u);
  for (const auto& f : failed) {
    EXPECT_TRUE(f.name == "broken" || f.name == "refused");
    EXPECT_FALSE(f.error.empty());
  }
  // Failed clients were closed after the handshake failed.
  EXPECT_EQ(broken->closed.load(), 1);

  auto catalog = manager->Catalog();
  EXPECT_TRUE(catalog.Has("fs-list_files"));
  EXPECT_TRUE(catalog.Has("fs-read_file"));
  EXPECT_EQ(catalog.Schemas().size(), 2u);

  auto desc = manager->DescribeJson();
  EXPECT_TRUE(desc["initialized"].get<bool>());
  ASSERT_EQ(desc["servers"].size(), 4u);
  for (const auto& s : desc["servers"]) {
    const auto name = s["name"].get<std::string>();
    if (name == "fs") EXPECT_EQ(s["status"], "usable");
    if (name == "broken") EXPECT_EQ(s["status"], "failed");
    if (name == "off") EXPECT_EQ(s["status"], "disabled");
  }
}

TEST(McpManagerTest, InitializeRunsOnce) {
  auto fs = MakeFsServer();
  auto manager = MakeFakeManager({{"fs", fs}});
  ASSERT_TRUE(manager);
  manager->Initialize();
  manager->EnsureInitialized();
  EXPECT_EQ(manager->UsableNames().size(), 1u);
}

TEST(McpManagerTest, NonexistentStdioCommandIsIsolated) {
  auto fs = MakeFsServer();
  nlohmann::json cfg = FakeConfig({"fs"});
  cfg["mcpServers"]["ghost"] = {{"command", "/nonexistent/floword-ghost-server"}};
  Error err;
  auto manager = McpManager::FromJson(cfg, FakeFactory({{"fs", fs}}), &err);
  ASSERT_TRUE(manager) << err.message;
  manager->Initialize();
  EXPECT_TRUE(Contains(manager->UsableNames(), "fs"));
  auto failed = manager->FailedServers();
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].name, "ghost");
  EXPECT_NE(failed[0].error.find("failed to start"), std::string::npos);
}

TEST(McpManagerTest, CallRoutesToServerTool) {
  auto fs = MakeFsServer();
  auto manager = MakeFakeManager({{"fs", fs}});
  Error err;
  auto result = manager->Call("fs", "read_file", {{"path", "notes.md"}}, &err);
  ASSERT_TRUE(result.has_value()) << err.message;
  EXPECT_EQ((*result)["content"][0]["text"], "contents of notes.md");
  auto calls = fs->Calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].second["path"], "notes.md");
}

TEST(McpManagerTest, ToolErrorsAreResultsNotFailures) {
  auto srv = std::make_shared<FakeServer>();
  srv->AddTool("explode", [](const nlohmann::json&) { return TextResult("disk on fire", true); });
  auto manager = MakeFakeManager({{"ops", srv}});
  Error err;
  auto result = manager->Call("ops", "explode", {}, &err);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(IsErrorResult(*result));
}

TEST(McpManagerTest, UnknownServerOrToolIsNotFound) {
  auto fs = MakeFsServer();
  auto broken = std::make_shared<FakeServer>();
  broken->fail_initialize = true;
  nlohmann::json cfg = FakeConfig({"fs", "broken"});
  cfg["mcpServers"]["off"] = {{"command", "x"}, {"enabled", false}};
  Error err;
  auto manager = McpManager::FromJson(cfg, FakeFactory({{"fs", fs}, {"broken", broken}}), &err);
  ASSERT_TRUE(manager);
  manager->Initialize();

  EXPECT_FALSE(manager->Call("nope", "list_files", {}, &err).has_value());
  EXPECT_EQ(err.kind, ErrorKind::kToolNotFound);
  EXPECT_FALSE(manager->Call("fs", "delete_everything", {}, &err).has_value());
  EXPECT_EQ(err.kind, ErrorKind::kToolNotFound);
  EXPECT_FALSE(manager->Call("off", "anything", {}, &err).has_value());
  EXPECT_EQ(err.kind, ErrorKind::kToolNotFound);
  EXPECT_NE(err.message.find("disabled"), std::string::npos);
  EXPECT_FALSE(manager->Call("broken", "anything", {}, &err).has_value());
  EXPECT_EQ(err.kind, ErrorKind::kToolNotFound);
  EXPECT_NE(err.message.find("failed to initialize"), std::string::npos);
  EXPECT_TRUE(fs->Calls().empty());
}

TEST(McpManagerTest, CallAfterCloseFailsAsNotFound) {
  auto fs = MakeFsServer();
  auto manager = MakeFakeManager({{"fs", fs}});
  EXPECT_TRUE(manager->Close().empty());
  EXPECT_EQ(fs->closed.load(), 1);
  Error err;
  EXPECT_FALSE(manager->Call("fs", "list_files", {}, &err).has_value());
  EXPECT_EQ(err.kind, ErrorKind::kToolNotFound);
  EXPECT_TRUE(manager->Close().empty());
}

TEST(McpManagerTest, RefreshPicksUpNewTools) {
  auto fs = MakeFsServer();
  auto manager = MakeFakeManager({{"fs", fs}});
  EXPECT_FALSE(manager->Catalog().Has("fs-stat"));
  fs->AddTool("stat", nullptr);
  EXPECT_TRUE(manager->RefreshTools().empty());
  EXPECT_TRUE(manager->Catalog().Has("fs-stat"));
}

TEST(McpManagerTest, ServerNameWithSeparatorIsConfigError) {
  Error err;
  auto manager = McpManager::FromJson(FakeConfig({"my-server"}), FakeFactory({}), &err);
  EXPECT_FALSE(manager);
  EXPECT_EQ(err.kind, ErrorKind::kConfig);
  EXPECT_NE(err.message.find("my-server"), std::string::npos);
}

TEST(McpManagerTest, MalformedConfigIsConfigError) {
  Error err;
  EXPECT_FALSE(McpManager::FromJson(nlohmann::json::array(), nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kConfig);
  EXPECT_FALSE(McpManager::FromJson({{"mcpServers", {{"fs", {{"args", {"x"}}}}}}}, nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kConfig);
  EXPECT_FALSE(McpManager::FromJson({{"mcpServers", "fs"}}, nullptr, &err));

  auto empty = McpManager::FromJson(nlohmann::json::object(), nullptr, &err);
  ASSERT_TRUE(empty);
  empty->Initialize();
  EXPECT_TRUE(empty->UsableNames().empty());
  EXPECT_TRUE(empty->Catalog().Empty());
}

TEST(McpManagerTest, LoadReadsConfigFile) {
  TempPath path("floword-mcp");
  {
    std::ofstream f(path.str());
    f << R"({"mcpServers": {"fs": {"command": "fake"}, "web": {"url": "http://127.0.0.1:1/sse", "enabled": false}}})";
  }
  Error err;
  auto manager = McpManager::Load(path.str(), FakeFactory({{"fs", MakeFsServer()}}), &err);
  ASSERT_TRUE(manager) << err.message;
  manager->Initialize();
  EXPECT_EQ(manager->UsableNames(), std::vector<std::string>({"fs"}));
  EXPECT_EQ(manager->DisabledNames(), std::vector<std::string>({"web"}));

  EXPECT_FALSE(McpManager::Load(path.str() + ".missing", nullptr, &err));
  EXPECT_EQ(err.kind, ErrorKind::kConfig);
}

TEST(McpManagerTest, ConcurrentCallsDoNotSerialize) {
  auto srv = std::make_shared<FakeServer>();
  srv->AddTool("slow", nullptr, std::chrono::milliseconds(200));
  auto manager = MakeFakeManager({{"srv", srv}});
  std::vector<std::thread> threads;
  for (int i = 0; i < 3; i++) {
    threads.emplace_back([&]() {
      Error err;
      EXPECT_TRUE(manager->Call("srv", "slow", {}, &err).has_value());
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(srv->max_active.load(), 3);
}
