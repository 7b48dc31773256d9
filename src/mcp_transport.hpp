#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace floword {

enum class TransportKind {
  kStdio,
  kSse,
};

struct ServerParams {
  TransportKind transport = TransportKind::kStdio;
  // stdio
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  // sse
  std::string url;
  std::map<std::string, std::string> headers;
  int connect_timeout_seconds = 5;
  int read_timeout_seconds = 300;
};

bool ParseServerParams(const nlohmann::json& j, ServerParams* out, std::string* err);

// Header values and environment values are redacted.
nlohmann::json ServerParamsToJson(const ServerParams& params);

class McpTransport {
 public:
  virtual ~McpTransport() = default;

  virtual bool Start(std::string* err) = 0;
  // Sends one JSON-RPC request and blocks until the response with the same id arrives.
  virtual std::optional<nlohmann::json> Request(const nlohmann::json& request, std::string* err) = 0;
  virtual bool Notify(const nlohmann::json& notification, std::string* err) = 0;
  virtual void Close() = 0;
};

std::unique_ptr<McpTransport> MakeTransport(const ServerParams& params);

// Correlates JSON-RPC responses with the callers waiting for them. Safe for concurrent use.
class PendingRequests {
 public:
  std::future<nlohmann::json> Add(const nlohmann::json& id);
  void Remove(const nlohmann::json& id);
  bool Resolve(const nlohmann::json& response);
  void FailAll(const std::string& reason);

 private:
  std::mutex mu_;
  std::unordered_map<std::string, std::promise<nlohmann::json>> waiting_;
  std::optional<std::string> failed_reason_;
};

bool IsJsonRpcResponse(const nlohmann::json& message);
bool IsJsonRpcRequest(const nlohmann::json& message);

// Reply for requests a server sends to the client. Only "ping" is supported.
nlohmann::json ReplyToServerRequest(const nlohmann::json& request);

class StdioTransport : public McpTransport {
 public:
  explicit StdioTransport(ServerParams params);
  ~StdioTransport() override;

  bool Start(std::string* err) override;
  std::optional<nlohmann::json> Request(const nlohmann::json& request, std::string* err) override;
  bool Notify(const nlohmann::json& notification, std::string* err) override;
  void Close() override;

 private:
  ServerParams params_;
  int pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;

  std::mutex write_mu_;
  std::mutex state_mu_;
  bool alive_ = false;
  bool closed_ = false;
  std::thread reader_;
  PendingRequests pending_;

  bool WriteLine(const std::string& line, std::string* err);
  void ReadLoop();
  void HandleLine(const std::string& line);
  bool IsAlive();
};

class SseTransport : public McpTransport {
 public:
  explicit SseTransport(ServerParams params);
  ~SseTransport() override;

  bool Start(std::string* err) override;
  std::optional<nlohmann::json> Request(const nlohmann::json& request, std::string* err) override;
  bool Notify(const nlohmann::json& notification, std::string* err) override;
  void Close() override;

  // Shared with the stream thread, which may outlive the transport.
  struct StreamState;

 private:
  ServerParams params_;
  std::shared_ptr<StreamState> state_;
  std::thread stream_thread_;
};

}  // namespace floword
