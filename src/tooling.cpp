#include "tooling.hpp"

#include <cctype>
#include <cstring>
#include <string>
#include <utility>

namespace floword {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::optional<std::string> ExtractFirstJsonObject(const std::string& text) {
  auto pos = text.find('{');
  if (pos == std::string::npos) return std::nullopt;
  int depth = 0;
  bool in_string = false;
  bool escape = false;
  for (size_t i = pos; i < text.size(); i++) {
    char c = text[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
      continue;
    }
    if (c == '{') depth++;
    if (c == '}') {
      depth--;
      if (depth == 0) return text.substr(pos, i - pos + 1);
    }
  }
  return std::nullopt;
}

}  // namespace

std::string ComposeToolName(const std::string& server, const std::string& tool) {
  return server + kToolNameSeparator + tool;
}

std::optional<ToolRef> SplitToolName(const std::string& exposed_name) {
  auto pos = exposed_name.find(kToolNameSeparator);
  if (pos == std::string::npos || pos == 0 || pos + 1 >= exposed_name.size()) return std::nullopt;
  ToolRef ref;
  ref.server = exposed_name.substr(0, pos);
  ref.tool = exposed_name.substr(pos + 1);
  return ref;
}

ToolCatalog::ToolCatalog(std::vector<ToolSchema> schemas) : schemas_(std::move(schemas)) {
  for (size_t i = 0; i < schemas_.size(); i++) by_name_[schemas_[i].name] = i;
}

bool ToolCatalog::Has(const std::string& exposed_name) const {
  return by_name_.find(exposed_name) != by_name_.end();
}

std::optional<ToolRef> ToolCatalog::Resolve(const std::string& exposed_name) const {
  auto it = by_name_.find(exposed_name);
  if (it != by_name_.end()) return schemas_[it->second].ref;
  return SplitToolName(exposed_name);
}

ToolCatalog BuildToolCatalog(const std::map<std::string, std::vector<McpToolInfo>>& tools_by_server) {
  std::vector<ToolSchema> schemas;
  for (const auto& [server, tools] : tools_by_server) {
    for (const auto& t : tools) {
      if (t.name.empty()) continue;
      ToolSchema schema;
      schema.name = ComposeToolName(server, t.name);
      schema.description = t.description.empty() ? t.title : t.description;
      schema.parameters = t.input_schema.is_null() ? nlohmann::json::object() : t.input_schema;
      schema.ref = {server, t.name};
      schemas.push_back(std::move(schema));
    }
  }
  return ToolCatalog(std::move(schemas));
}

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text) {
  auto trimmed = Trim(text);
  if (trimmed.empty()) return std::nullopt;
  if (auto j = nlohmann::json::parse(trimmed, nullptr, false); !j.is_discarded()) return j;
  if (auto obj = ExtractFirstJsonObject(trimmed)) {
    auto j = nlohmann::json::parse(*obj, nullptr, false);
    if (!j.is_discarded()) return j;
  }
  return std::nullopt;
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string SanitizeJsonForLog(const nlohmann::json& body) {
  if (body.is_null()) return "null";
  if (!body.is_object()) return body.dump();
  auto j = body;
  for (const auto& key : {"api_key", "api-key", "authorization", "apiKey", "password", "token"}) {
    if (j.contains(key)) j.erase(key);
  }
  if (j.contains("headers") && j["headers"].is_object()) {
    auto& h = j["headers"];
    for (const auto& key : {"authorization", "Authorization", "proxy-authorization", "api-key", "x-api-key"}) {
      if (h.contains(key)) h.erase(key);
    }
  }
  return j.dump();
}

}  // namespace floword
