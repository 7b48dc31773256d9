#include "config.hpp"
#include "conversation_controller.hpp"
#include "conversation_store.hpp"
#include "event_stream.hpp"
#include "http_router.hpp"
#include "mcp_manager.hpp"
#include "providers/openai_compatible_provider.hpp"
#include "providers/test_model.hpp"
#include "stop_signals.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>


#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {

static std::unique_ptr<floword::IModelEngine> MakeEngine(const floword::RuntimeConfig& cfg, std::string* err) {
  if (cfg.model_provider == "openai") {
    if (cfg.model_name.empty()) {
      if (err) *err = "FLOWORD_MODEL_NAME is required for the openai provider";
      return nullptr;
    }
    return std::make_unique<floword::OpenAiCompatibleProvider>(cfg.model_endpoint, cfg.model_name, cfg.model_api_key);
  }
  if (cfg.model_provider == "test") return std::make_unique<floword::TestModelEngine>();
  if (err) *err = "unknown model provider: " + cfg.model_provider;
  return nullptr;
}

static std::unique_ptr<floword::McpManager> MakeToolRegistry(const floword::RuntimeConfig& cfg, floword::Error* err) {
  std::error_code ec;
  if (!std::filesystem::exists(cfg.mcp_config_path, ec)) {
    std::cout << "[mcp] config not found path=" << cfg.mcp_config_path << " servers=0\n";
    return floword::McpManager::FromJson(nlohmann::json::object(), floword::DefaultTransportFactory(), err);
  }
  return floword::McpManager::Load(cfg.mcp_config_path, floword::DefaultTransportFactory(), err);
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);
  // Before any thread starts, so only the watcher sees SIGINT and SIGTERM.
  floword::StopSignalWatcher stop_signals;
  auto cfg = floword::LoadConfigFromEnv();

  floword::Error load_err;
  auto tools = MakeToolRegistry(cfg, &load_err);
  if (!tools) {
    std::cerr << "[mcp] invalid config path=" << cfg.mcp_config_path << " error=" << load_err.message << "\n";
    return 1;
  }

  std::string engine_err;
  auto engine = MakeEngine(cfg, &engine_err);
  if (!engine) {
    std::cerr << "[runtime] " << engine_err << "\n";
    return 1;
  }

  auto store = floword::MakeConversationStore(cfg);

  floword::StreamRegistryOptions stream_options;
  stream_options.capacity = cfg.stream_capacity;
  stream_options.grace = std::chrono::seconds(cfg.stream_grace_seconds);
  stream_options.abandoned = std::chrono::seconds(cfg.stream_abandoned_seconds);
  floword::StreamRegistry streams(stream_options);

  std::cout << "[runtime] provider=" << engine->Name() << " model=" << (cfg.model_name.empty() ? "-" : cfg.model_name)
            << " endpoint=" << floword::EndpointUrl(cfg.model_endpoint) << "\n";
  std::cout << "[runtime] store=" << cfg.conversation_store_type
            << " path=" << (cfg.conversation_store_path.empty() ? "-" : cfg.conversation_store_path) << "\n";
  std::cout << "[runtime] stream capacity=" << stream_options.capacity << " grace_s=" << cfg.stream_grace_seconds
            << " abandoned_s=" << cfg.stream_abandoned_seconds << "\n";

  // Servers that fail here stay listed as failed; a later refresh does not retry them.
  tools->Initialize();
  for (const auto& name : tools->UsableNames()) std::cout << "[mcp] usable server=" << name << "\n";
  for (const auto& failed : tools->FailedServers()) {
    std::cout << "[mcp] failed server=" << failed.name << " error=" << failed.error << "\n";
  }

  floword::ConversationController conversations(store.get(), tools.get(), engine.get(), &streams,
                                                 cfg.default_system_prompt);

  floword::RouterOptions router_options;
  router_options.allow_anonymous = cfg.allow_anonymous;
  floword::HttpRouter router(&conversations, &streams, tools.get(), router_options);

  httplib::Server server;
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    std::cout << "[http] exception message=" << message << "\n";
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", "server_error"}};
    res.status = 500;
    res.set_content(j.dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "server error";
      type = "server_error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", type}};
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    j["in_flight"] = conversations.InFlight();
    j["streams"] = streams.Count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  stop_signals.Start([&server](int) { server.stop(); });

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  stop_signals.Stop();

  conversations.Shutdown();
  for (const auto& e : tools->Close()) std::cout << "[mcp] close error=" << e << "\n";
  return ok ? 0 : 1;
}
