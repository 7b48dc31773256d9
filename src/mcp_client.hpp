#pragma once

#include "mcp_transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace floword {

struct McpToolInfo {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema;
};

// One tool-server connection. Requests may be issued from several threads once Initialize has succeeded.
class McpClient {
 public:
  explicit McpClient(std::unique_ptr<McpTransport> transport);
  ~McpClient();

  // Starts the transport and performs the initialize / notifications/initialized handshake.
  bool Initialize(std::string* err);
  bool IsInitialized() const;

  std::optional<std::vector<McpToolInfo>> ListTools(std::string* err);
  // Returns the tools/call result verbatim; a tool-level failure is a result with "isError": true.
  std::optional<nlohmann::json> CallTool(const std::string& name, const nlohmann::json& arguments, std::string* err);

  // Releases the transport. Safe to call more than once and on a client that never initialized.
  void Close();

  void SetMaxInFlight(int max_in_flight);
  const nlohmann::json& ServerInfo() const { return server_info_; }

 private:
  std::unique_ptr<McpTransport> transport_;
  nlohmann::json server_info_;
  int max_in_flight_ = 16;

  mutable std::mutex mu_;
  int64_t next_id_ = 1;
  int in_flight_ = 0;
  bool initialized_ = false;
  bool closed_ = false;

  std::optional<nlohmann::json> Rpc(const std::string& method, const nlohmann::json& params, std::string* err);
};

}  // namespace floword
