#pragma once

#include "errors.hpp"
#include "mcp_client.hpp"
#include "mcp_transport.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace floword {

using TransportFactory = std::function<std::unique_ptr<McpTransport>(const std::string& name, const ServerParams& params)>;

TransportFactory DefaultTransportFactory();

struct FailedServer {
  std::string name;
  ServerParams params;
  std::string error;
};

// Named tool-server connections built from {"mcpServers": {...}}. After Initialize every configured name is in
// exactly one of usable, disabled or failed. Failed servers are not retried.
class McpManager {
 public:
  static std::unique_ptr<McpManager> Load(const std::string& path, TransportFactory factory, Error* err);
  static std::unique_ptr<McpManager> FromJson(const nlohmann::json& config, TransportFactory factory, Error* err);

  ~McpManager();
  McpManager(const McpManager&) = delete;
  McpManager& operator=(const McpManager&) = delete;

  // Connects every enabled server concurrently. Runs once; later calls return immediately.
  void Initialize();
  void EnsureInitialized();
  bool IsInitialized() const;

  std::map<std::string, std::vector<McpToolInfo>> ListToolsByServer() const;
  ToolCatalog Catalog() const;

  // Re-lists tools of every usable server. Returns server name -> error for the ones that failed; their previous
  // catalog is kept.
  std::map<std::string, std::string> RefreshTools();

  std::optional<nlohmann::json> Call(const std::string& server,
                                     const std::string& tool,
                                     const nlohmann::json& arguments,
                                     Error* err);

  // Closes every usable client, continuing past failures. Returns the collected failures.
  std::vector<std::string> Close();

  std::vector<std::string> UsableNames() const;
  std::vector<std::string> DisabledNames() const;
  std::vector<FailedServer> FailedServers() const;

  nlohmann::json DescribeJson() const;

 private:
  McpManager(std::map<std::string, ServerParams> configured, std::vector<std::string> disabled, TransportFactory factory);

  std::map<std::string, ServerParams> configured_;
  std::vector<std::string> disabled_;
  TransportFactory factory_;

  std::mutex init_mu_;
  mutable std::shared_mutex mu_;
  bool initialized_ = false;
  std::map<std::string, std::shared_ptr<McpClient>> clients_;
  std::map<std::string, std::vector<McpToolInfo>> tools_;
  std::map<std::string, FailedServer> failed_;
};

}  // namespace floword
