#include "mcp_manager.hpp"

#include "messages.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <utility>

namespace floword {
namespace {

struct InitAttempt {
  std::string name;
  std::shared_ptr<McpClient> client;
  std::vector<McpToolInfo> tools;
  std::string error;
  bool ok = false;
};

static InitAttempt ConnectOne(const std::string& name, const ServerParams& params, const TransportFactory& factory) {
  InitAttempt a;
  a.name = name;
  auto transport = factory(name, params);
  if (!transport) {
    a.error = "no transport for server";
    return a;
  }
  a.client = std::make_shared<McpClient>(std::move(transport));
  std::string err;
  if (!a.client->Initialize(&err)) {
    a.error = err.empty() ? "initialize failed" : err;
    a.client->Close();
    return a;
  }
  auto tools = a.client->ListTools(&err);
  if (!tools) {
    a.error = "tools/list failed: " + err;
    a.client->Close();
    return a;
  }
  a.tools = std::move(*tools);
  a.ok = true;
  return a;
}

static bool ValidServerName(const std::string& name) {
  return !name.empty() && name.find(kToolNameSeparator) == std::string::npos;
}

static void LogMcpCall(const std::string& server, const std::string& tool, const nlohmann::json& arguments) {
  std::cout << "[mcp-call] server=" << server << " tool=" << tool
            << " arguments=" << TruncateForLog(SanitizeJsonForLog(arguments), 2000) << "\n";
}

static void LogMcpResult(const std::string& server, const std::string& tool, const nlohmann::json& result) {
  std::cout << "[mcp-result] server=" << server << " tool=" << tool << " is_error=" << (IsErrorResult(result) ? 1 : 0)
            << " result=" << TruncateForLog(result.dump(), 2000) << "\n";
}

}  // namespace

TransportFactory DefaultTransportFactory() {
  return [](const std::string&, const ServerParams& params) { return MakeTransport(params); };
}

std::unique_ptr<McpManager> McpManager::Load(const std::string& path, TransportFactory factory, Error* err) {
  std::ifstream in(path);
  if (!in) {
    SetError(err, ErrorKind::kConfig, "cannot open tool server config: " + path);
    return nullptr;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  auto j = nlohmann::json::parse(ss.str(), nullptr, false);
  if (j.is_discarded()) {
    SetError(err, ErrorKind::kConfig, "tool server config is not valid json: " + path);
    return nullptr;
  }
  return FromJson(j, std::move(factory), err);
}

std::unique_ptr<McpManager> McpManager::FromJson(const nlohmann::json& config, TransportFactory factory, Error* err) {
  if (!config.is_object()) {
    SetError(err, ErrorKind::kConfig, "tool server config must be an object");
    return nullptr;
  }
  std::map<std::string, ServerParams> configured;
  std::vector<std::string> disabled;
  if (config.contains("mcpServers") && !config["mcpServers"].is_null()) {
    const auto& servers = config["mcpServers"];
    if (!servers.is_object()) {
      SetError(err, ErrorKind::kConfig, "mcpServers must be an object");
      return nullptr;
    }
    for (auto it = servers.begin(); it != servers.end(); ++it) {
      const auto& name = it.key();
      if (!ValidServerName(name)) {
        SetError(err, ErrorKind::kConfig,
                 "invalid server name '" + name + "': must be non-empty and must not contain '" +
                     std::string(1, kToolNameSeparator) + "'");
        return nullptr;
      }
      auto entry = it.value();
      if (entry.is_object() && entry.contains("enabled")) {
        const bool enabled = !(entry["enabled"].is_boolean() && !entry["enabled"].get<bool>());
        entry.erase("enabled");
        if (!enabled) {
          disabled.push_back(name);
          continue;
        }
      }
      ServerParams params;
      std::string perr;
      if (!ParseServerParams(entry, &params, &perr)) {
        SetError(err, ErrorKind::kConfig, "server '" + name + "': " + perr);
        return nullptr;
      }
      configured.emplace(name, std::move(params));
    }
  }
  if (!factory) factory = DefaultTransportFactory();
  return std::unique_ptr<McpManager>(new McpManager(std::move(configured), std::move(disabled), std::move(factory)));
}

McpManager::McpManager(std::map<std::string, ServerParams> configured,
                       std::vector<std::string> disabled,
                       TransportFactory factory)
    : configured_(std::move(configured)), disabled_(std::move(disabled)), factory_(std::move(factory)) {}

McpManager::~McpManager() {
  for (const auto& e : Close()) std::cout << "[mcp] close error: " << e << "\n";
}

void McpManager::Initialize() {
  std::lock_guard<std::mutex> init_lock(init_mu_);
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    if (initialized_) return;
  }

  std::vector<std::pair<std::string, std::future<InitAttempt>>> futures;
  futures.reserve(configured_.size());
  for (const auto& kv : configured_) {
    const auto& name = kv.first;
    const auto& params = kv.second;
    futures.emplace_back(name, std::async(std::launch::async, [this, &name, &params]() {
                           return ConnectOne(name, params, factory_);
                         }));
  }

  std::vector<InitAttempt> attempts;
  attempts.reserve(futures.size());
  for (auto& f : futures) {
    try {
      attempts.push_back(f.second.get());
    } catch (const std::exception& e) {
      InitAttempt a;
      a.name = f.first;
      a.error = std::string("initialize threw: ") + e.what();
      attempts.push_back(std::move(a));
    }
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  for (auto& a : attempts) {
    if (a.ok) {
      std::cout << "[mcp] server=" << a.name << " initialized tools=" << a.tools.size() << "\n";
      clients_[a.name] = std::move(a.client);
      tools_[a.name] = std::move(a.tools);
    } else {
      std::cout << "[mcp] server=" << a.name << " failed to initialize: " << a.error << "\n";
      failed_[a.name] = FailedServer{a.name, configured_.at(a.name), a.error};
    }
  }
  for (const auto& name : disabled_) std::cout << "[mcp] server=" << name << " disabled\n";
  initialized_ = true;
  std::cout << "[mcp] initialized usable=" << clients_.size() << " failed=" << failed_.size()
            << " disabled=" << disabled_.size() << "\n";
}

void McpManager::EnsureInitialized() {
  if (!IsInitialized()) Initialize();
}

bool McpManager::IsInitialized() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return initialized_;
}

std::map<std::string, std::vector<McpToolInfo>> McpManager::ListToolsByServer() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return tools_;
}

ToolCatalog McpManager::Catalog() const { return BuildToolCatalog(ListToolsByServer()); }

std::map<std::string, std::string> McpManager::RefreshTools() {
  EnsureInitialized();
  std::map<std::string, std::shared_ptr<McpClient>> clients;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    clients = clients_;
  }

  std::vector<std::pair<std::string, std::future<std::pair<std::optional<std::vector<McpToolInfo>>, std::string>>>>
      futures;
  for (const auto& kv : clients) {
    auto client = kv.second;
    futures.emplace_back(kv.first, std::async(std::launch::async, [client]() {
                           std::string err;
                           auto tools = client->ListTools(&err);
                           return std::make_pair(std::move(tools), err);
                         }));
  }

  std::map<std::string, std::string> errors;
  std::map<std::string, std::vector<McpToolInfo>> refreshed;
  for (auto& f : futures) {
    try {
      auto r = f.second.get();
      if (r.first) {
        refreshed[f.first] = std::move(*r.first);
      } else {
        errors[f.first] = r.second;
      }
    } catch (const std::exception& e) {
      errors[f.first] = e.what();
    }
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  for (auto& kv : refreshed) {
    if (clients_.count(kv.first)) tools_[kv.first] = std::move(kv.second);
  }
  for (const auto& kv : errors) std::cout << "[mcp] server=" << kv.first << " refresh failed: " << kv.second << "\n";
  return errors;
}

std::optional<nlohmann::json> McpManager::Call(const std::string& server,
                                               const std::string& tool,
                                               const nlohmann::json& arguments,
                                               Error* err) {
  EnsureInitialized();
  std::shared_ptr<McpClient> client;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = clients_.find(server);
    if (it == clients_.end()) {
      std::string why = "unknown tool server: " + server;
      if (std::find(disabled_.begin(), disabled_.end(), server) != disabled_.end()) {
        why = "tool server is disabled: " + server;
      } else if (auto f = failed_.find(server); f != failed_.end()) {
        why = "tool server failed to initialize: " + server + ": " + f->second.error;
      }
      SetError(err, ErrorKind::kToolNotFound, why);
      return std::nullopt;
    }
    auto tools = tools_.find(server);
    const bool known = tools != tools_.end() && std::any_of(tools->second.begin(), tools->second.end(),
                                                            [&](const McpToolInfo& t) { return t.name == tool; });
    if (!known) {
      SetError(err, ErrorKind::kToolNotFound, "unknown tool: " + ComposeToolName(server, tool));
      return std::nullopt;
    }
    client = it->second;
  }

  LogMcpCall(server, tool, arguments);
  std::string call_err;
  auto result = client->CallTool(tool, arguments, &call_err);
  if (!result) {
    std::cout << "[mcp-result] server=" << server << " tool=" << tool << " transport_error=" << call_err << "\n";
    SetError(err, ErrorKind::kTransport, call_err);
    return std::nullopt;
  }
  LogMcpResult(server, tool, *result);
  return result;
}

std::vector<std::string> McpManager::Close() {
  std::map<std::string, std::shared_ptr<McpClient>> clients;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    clients.swap(clients_);
    tools_.clear();
  }
  std::vector<std::string> errors;
  for (auto& kv : clients) {
    try {
      kv.second->Close();
    } catch (const std::exception& e) {
      errors.push_back(kv.first + ": " + e.what());
    }
  }
  if (!clients.empty()) std::cout << "[mcp] closed clients=" << clients.size() << " errors=" << errors.size() << "\n";
  return errors;
}

std::vector<std::string> McpManager::UsableNames() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<std::string> out;
  for (const auto& kv : clients_) out.push_back(kv.first);
  return out;
}

std::vector<std::string> McpManager::DisabledNames() const { return disabled_; }

std::vector<FailedServer> McpManager::FailedServers() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<FailedServer> out;
  for (const auto& kv : failed_) out.push_back(kv.second);
  return out;
}

nlohmann::json McpManager::DescribeJson() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  nlohmann::json servers = nlohmann::json::array();
  for (const auto& kv : tools_) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& t : kv.second) {
      tools.push_back({{"name", ComposeToolName(kv.first, t.name)},
                       {"description", t.description.empty() ? t.title : t.description},
                       {"parameters", t.input_schema.is_null() ? nlohmann::json::object() : t.input_schema}});
    }
    servers.push_back({{"name", kv.first}, {"status", "usable"}, {"tools", std::move(tools)}});
  }
  for (const auto& kv : failed_) {
    servers.push_back({{"name", kv.first},
                       {"status", "failed"},
                       {"error", kv.second.error},
                       {"params", ServerParamsToJson(kv.second.params)}});
  }
  for (const auto& name : disabled_) servers.push_back({{"name", name}, {"status", "disabled"}});
  return {{"initialized", initialized_}, {"servers", std::move(servers)}};
}

}  // namespace floword
