#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace floword {

// Streams /v1/chat/completions from any OpenAI-compatible server.
class OpenAiCompatibleProvider : public IModelEngine {
 public:
  OpenAiCompatibleProvider(HttpEndpoint endpoint, std::string model, std::string api_key);

  std::string Name() const override;
  bool RequestStream(const std::vector<ModelMessage>& messages,
                     const std::vector<ToolSchema>& tools,
                     const ModelSettings& settings,
                     const StreamEventCallback& on_event,
                     ModelStreamResult* out,
                     std::string* err) override;

  nlohmann::json BuildRequestBody(const std::vector<ModelMessage>& messages,
                                  const std::vector<ToolSchema>& tools,
                                  const ModelSettings& settings) const;

 private:
  HttpEndpoint endpoint_;
  std::string model_;
  std::string api_key_;
};

// Incremental decoder for the chat.completion.chunk event stream. Feed raw bytes; events come out through the
// callback as parts open and grow.
class ChatCompletionStreamDecoder {
 public:
  explicit ChatCompletionStreamDecoder(StreamEventCallback on_event);

  // Returns false when the callback asked to stop.
  bool Feed(const char* data, size_t len);
  bool Done() const { return done_; }
  ModelStreamResult Finish(const std::string& fallback_model);

 private:
  struct ToolCallState {
    size_t part_index = 0;
    std::string args;
  };

  bool HandleLine(const std::string& line);
  bool HandleChunk(const nlohmann::json& chunk);

  StreamEventCallback on_event_;
  std::string buffer_;
  bool done_ = false;
  std::string model_name_;
  std::vector<MessagePart> parts_;
  std::optional<size_t> text_part_;
  std::map<int, ToolCallState> tool_calls_;
  Usage usage_;
};

}  // namespace floword
