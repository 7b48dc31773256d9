#include "mcp_client.hpp"

#include <string>
#include <utility>

namespace floword {
namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

static std::string ExtractJsonRpcError(const nlohmann::json& resp) {
  if (!resp.is_object()) return "invalid json-rpc response";
  if (!resp.contains("error") || !resp["error"].is_object()) return {};
  const auto& e = resp["error"];
  std::string msg;
  if (e.contains("message") && e["message"].is_string()) msg = e["message"].get<std::string>();
  if (msg.empty()) msg = "json-rpc error";
  if (e.contains("code") && e["code"].is_number_integer()) msg += " (code " + std::to_string(e["code"].get<int>()) + ")";
  return msg;
}

static std::optional<nlohmann::json> ExtractJsonRpcResult(const nlohmann::json& resp) {
  if (!resp.is_object()) return std::nullopt;
  if (resp.contains("result")) return resp["result"];
  return std::nullopt;
}

}  // namespace

McpClient::McpClient(std::unique_ptr<McpTransport> transport) : transport_(std::move(transport)) {}

McpClient::~McpClient() { Close(); }

void McpClient::SetMaxInFlight(int max_in_flight) {
  if (max_in_flight > 0) max_in_flight_ = max_in_flight;
}

bool McpClient::IsInitialized() const {
  std::lock_guard<std::mutex> lock(mu_);
  return initialized_;
}

bool McpClient::Initialize(std::string* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (initialized_) return true;
    if (closed_ || !transport_) {
      if (err) *err = "mcp: client closed";
      return false;
    }
  }
  if (!transport_->Start(err)) return false;

  nlohmann::json params;
  params["protocolVersion"] = kProtocolVersion;
  params["capabilities"] = nlohmann::json::object();
  params["clientInfo"] = {{"name", "floword"}, {"version", "0.1.0"}};
  auto r = Rpc("initialize", params, err);
  if (!r) return false;
  if (r->is_object() && r->contains("serverInfo")) server_info_ = (*r)["serverInfo"];

  nlohmann::json note;
  note["jsonrpc"] = "2.0";
  note["method"] = "notifications/initialized";
  if (!transport_->Notify(note, err)) return false;

  std::lock_guard<std::mutex> lock(mu_);
  initialized_ = true;
  return true;
}

std::optional<std::vector<McpToolInfo>> McpClient::ListTools(std::string* err) {
  std::vector<McpToolInfo> out;
  std::string cursor;
  for (int page = 0; page < 64; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = Rpc("tools/list", params, err);
    if (!r) return std::nullopt;
    if (!r->is_object() || !r->contains("tools") || !(*r)["tools"].is_array()) return out;
    for (const auto& t : (*r)["tools"]) {
      if (!t.is_object()) continue;
      McpToolInfo info;
      if (t.contains("name") && t["name"].is_string()) info.name = t["name"].get<std::string>();
      if (t.contains("title") && t["title"].is_string()) info.title = t["title"].get<std::string>();
      if (t.contains("description") && t["description"].is_string()) info.description = t["description"].get<std::string>();
      if (t.contains("inputSchema") && t["inputSchema"].is_object()) info.input_schema = t["inputSchema"];
      if (!info.name.empty()) out.push_back(std::move(info));
    }
    if (r->contains("nextCursor") && (*r)["nextCursor"].is_string()) {
      cursor = (*r)["nextCursor"].get<std::string>();
      if (cursor.empty()) break;
    } else {
      break;
    }
  }
  return out;
}

std::optional<nlohmann::json> McpClient::CallTool(const std::string& name,
                                                  const nlohmann::json& arguments,
                                                  std::string* err) {
  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments.is_null() ? nlohmann::json::object() : arguments;
  auto r = Rpc("tools/call", params, err);
  if (!r) return std::nullopt;
  if (!r->is_object()) {
    if (err) *err = "mcp: tools/call result is not an object";
    return std::nullopt;
  }
  return r;
}

void McpClient::Close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return;
    closed_ = true;
    initialized_ = false;
  }
  if (transport_) transport_->Close();
}

std::optional<nlohmann::json> McpClient::Rpc(const std::string& method,
                                             const nlohmann::json& params,
                                             std::string* err) {
  int64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      if (err) *err = "mcp: client closed";
      return std::nullopt;
    }
    if (in_flight_ >= max_in_flight_) {
      if (err) *err = "mcp: too many in-flight requests";
      return std::nullopt;
    }
    in_flight_++;
    id = next_id_++;
  }

  auto dec = [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_--;
  };

  nlohmann::json req;
  req["jsonrpc"] = "2.0";
  req["id"] = id;
  req["method"] = method;
  req["params"] = params;

  auto resp = transport_->Request(req, err);
  if (!resp) {
    dec();
    return std::nullopt;
  }

  auto rpc_err = ExtractJsonRpcError(*resp);
  if (!rpc_err.empty()) {
    if (err) *err = "mcp: " + method + ": " + rpc_err;
    dec();
    return std::nullopt;
  }
  auto result = ExtractJsonRpcResult(*resp);
  if (!result) {
    if (err) *err = "mcp: missing result";
    dec();
    return std::nullopt;
  }
  dec();
  return result;
}

}  // namespace floword
