#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace floword {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 9772;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 11434;
  std::string base_path;
};

struct RuntimeConfig {
  HttpListenConfig listen;
  std::string mcp_config_path = "./mcp.json";
  std::string conversation_store_type = "memory";
  std::string conversation_store_path;
  std::string default_system_prompt;
  std::string model_provider = "openai";
  HttpEndpoint model_endpoint;
  std::string model_name;
  std::string model_api_key;
  size_t stream_capacity = 1000;
  int stream_grace_seconds = 30;
  int stream_abandoned_seconds = 3600;
  bool allow_anonymous = true;
};

RuntimeConfig LoadConfigFromEnv();

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);
std::string EndpointUrl(const HttpEndpoint& ep);
bool TryParseBool(const std::string& s, bool* out);

}  // namespace floword
