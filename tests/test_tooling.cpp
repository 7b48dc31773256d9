#include "tooling.hpp"

#include <gtest/gtest.h>

using namespace floword;

TEST(ToolNameTest, ComposeJoinsWithSeparator) { EXPECT_EQ(ComposeToolName("fs", "list_files"), "fs-list_files"); }

TEST(ToolNameTest, SplitUsesFirstSeparator) {
  auto ref = SplitToolName("fs-read-file");
  ASSERT_TRUE(ref.has_value());
  EXPECT_EQ(ref->server, "fs");
  EXPECT_EQ(ref->tool, "read-file");
}

TEST(ToolNameTest, SplitRejectsMalformedNames) {
  EXPECT_FALSE(SplitToolName("nodash").has_value());
  EXPECT_FALSE(SplitToolName("-tool").has_value());
  EXPECT_FALSE(SplitToolName("server-").has_value());
  EXPECT_FALSE(SplitToolName("").has_value());
}

TEST(ToolCatalogTest, BuildsExposedNamesPerServer) {
  std::map<std::string, std::vector<McpToolInfo>> by_server;
  McpToolInfo list;
  list.name = "list_files";
  list.description = "List files";
  list.input_schema = {{"type", "object"}};
  McpToolInfo titled;
  titled.name = "query";
  titled.title = "Run a query";
  McpToolInfo unnamed;
  by_server["fs"] = {list, unnamed};
  by_server["db"] = {titled};

  auto catalog = BuildToolCatalog(by_server);
  ASSERT_EQ(catalog.Schemas().size(), 2u);
  EXPECT_TRUE(catalog.Has("fs-list_files"));
  EXPECT_TRUE(catalog.Has("db-query"));
  EXPECT_FALSE(catalog.Has("list_files"));

  for (const auto& s : catalog.Schemas()) {
    if (s.name == "db-query") {
      EXPECT_EQ(s.description, "Run a query");
      EXPECT_TRUE(s.parameters.is_object());
      EXPECT_EQ(s.ref.server, "db");
      EXPECT_EQ(s.ref.tool, "query");
    }
  }
}

TEST(ToolCatalogTest, ResolveFallsBackToSplit) {
  ToolCatalog catalog;
  EXPECT_TRUE(catalog.Empty());
  auto ref = catalog.Resolve("gone-tool");
  ASSERT_TRUE(ref.has_value());
  EXPECT_EQ(ref->server, "gone");
  EXPECT_EQ(ref->tool, "tool");
  EXPECT_FALSE(catalog.Resolve("plain").has_value());
}

TEST(ParseJsonLooseTest, AcceptsJsonWrappedInText) {
  auto j = ParseJsonLoose("sure, here: {\"path\": \"/tmp\"} thanks");
  ASSERT_TRUE(j.has_value());
  EXPECT_EQ((*j)["path"], "/tmp");

  EXPECT_FALSE(ParseJsonLoose("   ").has_value());
  EXPECT_FALSE(ParseJsonLoose("{\"unterminated\": ").has_value());
  EXPECT_EQ(ParseJsonLoose(" [1,2] ")->size(), 2u);
}

TEST(LogHelpersTest, TruncateAndSanitize) {
  EXPECT_EQ(TruncateForLog("short", 10), "short");
  const auto t = TruncateForLog(std::string(100, 'x'), 30);
  EXPECT_EQ(t.size(), 30u);
  EXPECT_NE(t.find("(truncated)"), std::string::npos);
  EXPECT_EQ(TruncateForLog("abc", 0), "");

  nlohmann::json body = {{"api_key", "secret"}, {"path", "a"}, {"headers", {{"Authorization", "Bearer x"}}}};
  const auto s = SanitizeJsonForLog(body);
  EXPECT_EQ(s.find("secret"), std::string::npos);
  EXPECT_EQ(s.find("Bearer"), std::string::npos);
  EXPECT_NE(s.find("\"path\""), std::string::npos);
}
