#pragma once

#include "mcp_client.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace floword {

// Tools are exposed to the model as "{server}-{tool}". Server names never contain the separator, so the first
// occurrence always ends the server part and tool names are free to contain it.
constexpr char kToolNameSeparator = '-';

struct ToolRef {
  std::string server;
  std::string tool;
};

struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json parameters;
  ToolRef ref;
};

std::string ComposeToolName(const std::string& server, const std::string& tool);
std::optional<ToolRef> SplitToolName(const std::string& exposed_name);

class ToolCatalog {
 public:
  ToolCatalog() = default;
  explicit ToolCatalog(std::vector<ToolSchema> schemas);

  const std::vector<ToolSchema>& Schemas() const { return schemas_; }
  bool Empty() const { return schemas_.empty(); }
  bool Has(const std::string& exposed_name) const;

  // Catalog lookup first, first-separator split for names the catalog no longer carries.
  std::optional<ToolRef> Resolve(const std::string& exposed_name) const;

 private:
  std::vector<ToolSchema> schemas_;
  std::unordered_map<std::string, size_t> by_name_;
};

ToolCatalog BuildToolCatalog(const std::map<std::string, std::vector<McpToolInfo>>& tools_by_server);

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text);

std::string TruncateForLog(std::string s, size_t max_chars);
std::string SanitizeJsonForLog(const nlohmann::json& body);

}  // namespace floword
