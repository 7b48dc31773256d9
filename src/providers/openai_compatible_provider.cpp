#include "providers/openai_compatible_provider.hpp"

#include <httplib.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace floword {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(5);
  cli->set_read_timeout(300);
  cli->set_write_timeout(30);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

// Text handed to the model for a tool result: the joined text items of a CallToolResult, the JSON otherwise.
static std::string ToolResultText(const nlohmann::json& result) {
  if (result.is_string()) return result.get<std::string>();
  if (result.is_object() && result.contains("content") && result["content"].is_array()) {
    std::string text;
    bool all_text = true;
    for (const auto& item : result["content"]) {
      if (item.is_object() && item.value("type", "") == "text" && item.contains("text") && item["text"].is_string()) {
        if (!text.empty()) text += "\n";
        text += item["text"].get<std::string>();
      } else {
        all_text = false;
      }
    }
    if (all_text && !IsErrorResult(result)) return text;
  }
  return result.dump();
}

static int64_t GetInt(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_number_integer()) return j[key].get<int64_t>();
  return 0;
}

}  // namespace

ModelSettings ModelSettingsFromJson(const nlohmann::json& j) {
  ModelSettings s;
  if (!j.is_object()) return s;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto& key = it.key();
    const auto& v = it.value();
    if (key == "max_tokens" && v.is_number_integer()) {
      s.max_tokens = v.get<int>();
    } else if (key == "temperature" && v.is_number()) {
      s.temperature = v.get<float>();
    } else if (key == "top_p" && v.is_number()) {
      s.top_p = v.get<float>();
    } else if (!v.is_null()) {
      s.extra[key] = v;
    }
  }
  return s;
}

OpenAiCompatibleProvider::OpenAiCompatibleProvider(HttpEndpoint endpoint, std::string model, std::string api_key)
    : endpoint_(std::move(endpoint)), model_(std::move(model)), api_key_(std::move(api_key)) {}

std::string OpenAiCompatibleProvider::Name() const { return "openai"; }

nlohmann::json OpenAiCompatibleProvider::BuildRequestBody(const std::vector<ModelMessage>& messages,
                                                          const std::vector<ToolSchema>& tools,
                                                          const ModelSettings& settings) const {
  std::set<std::string> returned_ids;
  for (const auto& m : messages) {
    if (m.kind != MessageKind::kRequest) continue;
    for (const auto& p : m.parts) {
      if (p.kind == PartKind::kToolReturn) returned_ids.insert(p.tool_call_id);
    }
  }

  nlohmann::json j;
  j["model"] = model_;
  j["stream"] = true;
  j["stream_options"] = {{"include_usage", true}};
  j["messages"] = nlohmann::json::array();
  for (const auto& m : messages) {
    if (m.kind == MessageKind::kRequest) {
      for (const auto& p : m.parts) {
        switch (p.kind) {
          case PartKind::kSystemPrompt:
            if (!p.content.empty()) j["messages"].push_back({{"role", "system"}, {"content", p.content}});
            break;
          case PartKind::kUserPrompt:
            j["messages"].push_back({{"role", "user"}, {"content", p.content}});
            break;
          case PartKind::kToolReturn:
            j["messages"].push_back(
                {{"role", "tool"}, {"tool_call_id", p.tool_call_id}, {"content", ToolResultText(p.result)}});
            break;
          default:
            break;
        }
      }
      continue;
    }
    nlohmann::json jm;
    jm["role"] = "assistant";
    const auto text = TextContent(m);
    nlohmann::json calls = nlohmann::json::array();
    for (const auto& p : ToolCallParts(m)) {
      // Calls that never ran have no matching tool message and would be rejected upstream.
      if (!returned_ids.count(p.tool_call_id)) continue;
      calls.push_back({{"id", p.tool_call_id},
                       {"type", "function"},
                       {"function", {{"name", p.tool_name}, {"arguments", p.args.dump()}}}});
    }
    if (text.empty() && calls.empty()) continue;
    jm["content"] = text.empty() ? nlohmann::json() : nlohmann::json(text);
    if (!calls.empty()) jm["tool_calls"] = std::move(calls);
    j["messages"].push_back(std::move(jm));
  }

  if (!tools.empty()) {
    j["tools"] = nlohmann::json::array();
    for (const auto& t : tools) {
      j["tools"].push_back({{"type", "function"},
                            {"function",
                             {{"name", t.name},
                              {"description", t.description},
                              {"parameters", t.parameters.is_object() ? t.parameters : nlohmann::json::object()}}}});
    }
  }
  if (settings.max_tokens.has_value() && settings.max_tokens.value() > 0) j["max_tokens"] = settings.max_tokens.value();
  if (settings.temperature.has_value()) j["temperature"] = settings.temperature.value();
  if (settings.top_p.has_value()) j["top_p"] = settings.top_p.value();
  if (settings.extra.is_object()) {
    for (auto it = settings.extra.begin(); it != settings.extra.end(); ++it) {
      if (!j.contains(it.key())) j[it.key()] = it.value();
    }
  }
  return j;
}

bool OpenAiCompatibleProvider::RequestStream(const std::vector<ModelMessage>& messages,
                                             const std::vector<ToolSchema>& tools,
                                             const ModelSettings& settings,
                                             const StreamEventCallback& on_event,
                                             ModelStreamResult* out,
                                             std::string* err) {
  auto cli = MakeClient(endpoint_);
  if (!cli->is_valid()) {
    if (err) *err = "openai: invalid endpoint " + EndpointUrl(endpoint_);
    return false;
  }
  const auto body = BuildRequestBody(messages, tools, settings);
  std::cout << "[provider] openai model=" << model_ << " messages=" << body["messages"].size()
            << " tools=" << tools.size() << "\n";

  ChatCompletionStreamDecoder decoder(on_event);
  std::string raw;
  bool stopped = false;

  httplib::Request req;
  req.method = "POST";
  req.path = JoinPath(endpoint_.base_path, "/v1/chat/completions");
  req.headers.emplace("Accept", "text/event-stream");
  req.headers.emplace("Content-Type", "application/json");
  if (!api_key_.empty()) req.headers.emplace("Authorization", "Bearer " + api_key_);
  req.body = body.dump();
  req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    if (raw.size() < 4096) raw.append(data, std::min(len, static_cast<size_t>(4096 - raw.size())));
    if (!decoder.Feed(data, len)) {
      stopped = true;
      return false;
    }
    return true;
  };

  auto res = cli->send(req);
  if (stopped) {
    if (err) *err = "openai: stream cancelled";
    return false;
  }
  if (!res) {
    if (err) *err = "openai: request failed: " + httplib::to_string(res.error());
    return false;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "openai: /v1/chat/completions http " + std::to_string(res->status) + ": " + TruncateForLog(raw, 500);
    return false;
  }
  *out = decoder.Finish(model_);
  return true;
}

ChatCompletionStreamDecoder::ChatCompletionStreamDecoder(StreamEventCallback on_event)
    : on_event_(std::move(on_event)) {}

bool ChatCompletionStreamDecoder::Feed(const char* data, size_t len) {
  buffer_.append(data, len);
  size_t pos = 0;
  while ((pos = buffer_.find('\n')) != std::string::npos) {
    auto line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!HandleLine(line)) return false;
  }
  return true;
}

bool ChatCompletionStreamDecoder::HandleLine(const std::string& line) {
  if (line.compare(0, 5, "data:") != 0) return true;
  std::string payload = line.substr(5);
  while (!payload.empty() && payload.front() == ' ') payload.erase(0, 1);
  if (payload == "[DONE]") {
    done_ = true;
    return true;
  }
  auto chunk = nlohmann::json::parse(payload, nullptr, false);
  if (chunk.is_discarded() || !chunk.is_object()) return true;
  return HandleChunk(chunk);
}

bool ChatCompletionStreamDecoder::HandleChunk(const nlohmann::json& chunk) {
  if (chunk.contains("model") && chunk["model"].is_string()) model_name_ = chunk["model"].get<std::string>();
  if (chunk.contains("usage") && chunk["usage"].is_object()) {
    const auto& u = chunk["usage"];
    usage_.request_tokens = GetInt(u, "prompt_tokens");
    usage_.response_tokens = GetInt(u, "completion_tokens");
    usage_.total_tokens = GetInt(u, "total_tokens");
    if (usage_.total_tokens == 0) usage_.total_tokens = usage_.request_tokens + usage_.response_tokens;
  }
  if (!chunk.contains("choices") || !chunk["choices"].is_array() || chunk["choices"].empty()) return true;
  const auto& choice = chunk["choices"][0];
  if (!choice.is_object() || !choice.contains("delta") || !choice["delta"].is_object()) return true;
  const auto& delta = choice["delta"];

  if (delta.contains("content") && delta["content"].is_string()) {
    const auto text = delta["content"].get<std::string>();
    if (!text.empty()) {
      StreamEvent ev;
      if (!text_part_) {
        text_part_ = parts_.size();
        parts_.push_back(MakeTextPart(text));
        ev.kind = StreamEventKind::kPartStart;
        ev.index = static_cast<int>(*text_part_);
        ev.part = parts_.back();
      } else {
        parts_[*text_part_].content += text;
        ev.kind = StreamEventKind::kPartDelta;
        ev.index = static_cast<int>(*text_part_);
        ev.delta.content_delta = text;
      }
      if (on_event_ && !on_event_(ev)) return false;
    }
  }

  if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
    for (const auto& tc : delta["tool_calls"]) {
      if (!tc.is_object()) continue;
      const int idx = tc.contains("index") && tc["index"].is_number_integer() ? tc["index"].get<int>() : 0;
      std::string id = tc.contains("id") && tc["id"].is_string() ? tc["id"].get<std::string>() : std::string();
      std::string name;
      std::string args;
      if (tc.contains("function") && tc["function"].is_object()) {
        const auto& f = tc["function"];
        if (f.contains("name") && f["name"].is_string()) name = f["name"].get<std::string>();
        if (f.contains("arguments") && f["arguments"].is_string()) args = f["arguments"].get<std::string>();
      }

      StreamEvent ev;
      auto it = tool_calls_.find(idx);
      if (it == tool_calls_.end()) {
        ToolCallState st;
        st.part_index = parts_.size();
        st.args = args;
        parts_.push_back(MakeToolCallPart(name, nlohmann::json::object(), id));
        tool_calls_[idx] = st;
        ev.kind = StreamEventKind::kPartStart;
        ev.index = static_cast<int>(st.part_index);
        ev.part = parts_.back();
        if (!args.empty()) ev.part.args = ParseJsonLoose(args).value_or(nlohmann::json::object());
      } else {
        auto& part = parts_[it->second.part_index];
        part.tool_name += name;
        it->second.args += args;
        ev.kind = StreamEventKind::kPartDelta;
        ev.index = static_cast<int>(it->second.part_index);
        ev.delta.tool_call = true;
        ev.delta.tool_name_delta = name;
        ev.delta.args_delta = args;
        ev.delta.tool_call_id = part.tool_call_id;
      }
      if (on_event_ && !on_event_(ev)) return false;
    }
  }
  return true;
}

ModelStreamResult ChatCompletionStreamDecoder::Finish(const std::string& fallback_model) {
  if (!buffer_.empty()) {
    auto line = buffer_;
    buffer_.clear();
    HandleLine(line);
  }
  for (const auto& kv : tool_calls_) {
    auto& part = parts_[kv.second.part_index];
    if (kv.second.args.empty()) continue;
    auto parsed = ParseJsonLoose(kv.second.args);
    if (parsed && parsed->is_object()) {
      part.args = *parsed;
    } else {
      std::cout << "[provider] openai tool call " << part.tool_call_id << " has unparsable arguments: "
                << TruncateForLog(kv.second.args, 200) << "\n";
    }
  }
  ModelStreamResult r;
  r.response.kind = MessageKind::kResponse;
  r.response.parts = parts_;
  r.response.model_name = model_name_.empty() ? fallback_model : model_name_;
  r.response.timestamp_ms = NowMillis();
  r.usage = usage_;
  return r;
}

}  // namespace floword
