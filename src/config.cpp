#include "config.hpp"

#include <cstdlib>
#include <string>
#include <vector>

namespace floword {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseInt(const std::string& s, long long* out) {
  if (s.empty() || !out) return false;
  char* end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = ep.scheme == "https" && default_port == 80 ? 443 : default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::string EndpointUrl(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port) + ep.base_path;
}

bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

RuntimeConfig LoadConfigFromEnv() {
  RuntimeConfig cfg;

  if (auto host = GetEnvStr("FLOWORD_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("FLOWORD_LISTEN_PORT"); !port.empty()) cfg.listen.port = std::atoi(port.c_str());

  if (auto p = GetEnvStr("FLOWORD_MCP_CONFIG_PATH"); !p.empty()) cfg.mcp_config_path = p;

  if (auto store = GetEnvStr("FLOWORD_CONVERSATION_STORE_PATH"); !store.empty()) cfg.conversation_store_path = store;
  bool store_type_explicit = false;
  if (auto stype = GetEnvStr("FLOWORD_CONVERSATION_STORE_TYPE"); !stype.empty()) {
    cfg.conversation_store_type = ToLower(stype);
    store_type_explicit = true;
  }
  if (!store_type_explicit && !cfg.conversation_store_path.empty()) cfg.conversation_store_type = "file";

  if (auto prompt = GetEnvStr("FLOWORD_DEFAULT_SYSTEM_PROMPT"); !prompt.empty()) cfg.default_system_prompt = prompt;

  if (auto provider = GetEnvStr("FLOWORD_MODEL_PROVIDER"); !provider.empty()) cfg.model_provider = ToLower(provider);
  if (auto ep = GetEnvStr("FLOWORD_MODEL_ENDPOINT"); !ep.empty()) cfg.model_endpoint = ParseHttpEndpoint(ep, 80);
  if (auto model = GetEnvStr("FLOWORD_MODEL_NAME"); !model.empty()) cfg.model_name = model;
  if (auto key = GetEnvStr("FLOWORD_MODEL_API_KEY"); !key.empty()) cfg.model_api_key = key;

  long long n = 0;
  if (TryParseInt(GetEnvStr("FLOWORD_STREAM_CAPACITY"), &n) && n > 0) cfg.stream_capacity = static_cast<size_t>(n);
  if (TryParseInt(GetEnvStr("FLOWORD_STREAM_GRACE_SECONDS"), &n) && n >= 0) cfg.stream_grace_seconds = static_cast<int>(n);
  if (TryParseInt(GetEnvStr("FLOWORD_STREAM_ABANDONED_SECONDS"), &n) && n > 0) {
    cfg.stream_abandoned_seconds = static_cast<int>(n);
  }

  if (auto anon = GetEnvStr("FLOWORD_ALLOW_ANONYMOUS"); !anon.empty()) {
    bool b = true;
    if (TryParseBool(anon, &b)) cfg.allow_anonymous = b;
  }

  return cfg;
}

}  // namespace floword
