#pragma once

#include "messages.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace floword {

struct ModelSettings {
  std::optional<int> max_tokens;
  std::optional<float> temperature;
  std::optional<float> top_p;
  // Passed through to the upstream request body as-is.
  nlohmann::json extra = nlohmann::json::object();
};

ModelSettings ModelSettingsFromJson(const nlohmann::json& j);

struct ModelStreamResult {
  ModelMessage response;
  Usage usage;
};

// Returning false from the callback stops the stream early.
using StreamEventCallback = std::function<bool(const StreamEvent&)>;

// Language-model completion engine: takes the history and the tool catalog, streams response events and returns the
// finalized response turn with the usage of this one exchange.
class IModelEngine {
 public:
  virtual ~IModelEngine() = default;

  virtual std::string Name() const = 0;
  virtual bool RequestStream(const std::vector<ModelMessage>& messages,
                             const std::vector<ToolSchema>& tools,
                             const ModelSettings& settings,
                             const StreamEventCallback& on_event,
                             ModelStreamResult* out,
                             std::string* err) = 0;
};

}  // namespace floword
