#include "http_router.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace floword {
namespace {

constexpr const char* kAnonymousUser = "anonymous";

static nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}};
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

static void SendError(httplib::Response* res, const Error& err) {
  SendJson(res, HttpStatusForError(err.kind), MakeError(err.message, ErrorKindName(err.kind)));
}

static void SendBadRequest(httplib::Response* res, const std::string& message) {
  SendJson(res, 400, MakeError(message, ErrorKindName(ErrorKind::kInvalidRequest)));
}

static std::string SseData(size_t index, const nlohmann::json& j) {
  return "id: " + std::to_string(index) + "\ndata: " + j.dump() + "\n\n";
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  if (req.body.empty()) return nlohmann::json::object();
  return nlohmann::json::parse(req.body, nullptr, false);
}

static std::string RedactHeaderValue(const std::string& key, const std::string& value) {
  std::string k;
  for (char c : key) k.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (k == "authorization" || k == "proxy-authorization" || k == "api-key" || k == "x-api-key") return "<redacted>";
  return value;
}

static void LogRequest(const httplib::Request& req) {
  std::cout << "[request] " << req.method << " " << req.path;
  if (req.has_header("X-User-Id")) {
    std::cout << " user=" << RedactHeaderValue("X-User-Id", req.get_header_value("X-User-Id"));
  }
  std::cout << "\n";
  if (!req.body.empty()) {
    auto j = nlohmann::json::parse(req.body, nullptr, false);
    std::cout << "  body: " << TruncateForLog(j.is_discarded() ? req.body : SanitizeJsonForLog(j), 2000) << "\n";
  }
}

static bool ParseIntParam(const httplib::Request& req, const char* key, int* out) {
  if (!req.has_param(key)) return true;
  const auto v = req.get_param_value(key);
  char* end = nullptr;
  errno = 0;
  long n = std::strtol(v.c_str(), &end, 10);
  if (v.empty() || end == v.c_str() || *end != '\0' || errno == ERANGE) return false;
  if (n < INT_MIN || n > INT_MAX) return false;
  *out = static_cast<int>(n);
  return true;
}

static bool ParseOptionalMessages(const nlohmann::json& body,
                                  std::optional<std::vector<ModelMessage>>* out,
                                  std::string* err) {
  if (!body.contains("redacted_messages") || body["redacted_messages"].is_null()) return true;
  auto messages = MessagesFromJson(body["redacted_messages"], err);
  if (!messages) return false;
  *out = std::move(*messages);
  return true;
}

static ModelSettings ParseSettings(const nlohmann::json& body) {
  if (body.contains("llm_model_settings")) return ModelSettingsFromJson(body["llm_model_settings"]);
  return {};
}

}  // namespace

SseOutcome WriteStreamEvents(StreamReader* reader,
                             std::chrono::milliseconds keepalive,
                             const std::function<bool(const std::string&)>& write) {
  size_t reported_lost = reader->Lost();
  nlohmann::json ev;
  while (true) {
    const auto st = reader->Next(&ev, keepalive);
    if (reader->Lost() != reported_lost) {
      const auto lost = reader->Lost() - reported_lost;
      reported_lost = reader->Lost();
      if (!write(": lost " + std::to_string(lost) + " events\n\n")) return SseOutcome::kConsumerGone;
    }
    if (st == ReadStatus::kEvent) {
      // The cursor points one past the event just read.
      if (!write(SseData(reader->Position() - 1, ev))) return SseOutcome::kConsumerGone;
    } else if (st == ReadStatus::kTimeout) {
      if (!write(": keepalive\n\n")) return SseOutcome::kConsumerGone;
    } else {
      return SseOutcome::kCompleted;
    }
  }
}

HttpRouter::HttpRouter(ConversationController* conversations,
                       StreamRegistry* streams,
                       McpManager* tools,
                       RouterOptions options)
    : conversations_(conversations), streams_(streams), tools_(tools), options_(options) {}

void HttpRouter::Register(httplib::Server* server) {
  auto resolve_user = [this](const httplib::Request& req, httplib::Response& res, std::string* user) -> bool {
    auto id = req.get_header_value("X-User-Id");
    if (!id.empty()) {
      *user = id;
      return true;
    }
    if (options_.allow_anonymous) {
      *user = kAnonymousUser;
      return true;
    }
    SendJson(&res, 401, MakeError("missing X-User-Id header", "unauthorized"));
    return false;
  };

  server->Post("/api/v1/conversation/create", [=](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    std::string user;
    if (!resolve_user(req, res, &user)) return;
    auto r = conversations_->Create(user);
    SendJson(&res, 200, {{"conversation_id", r.conversation_id}});
  });

  server->Get("/api/v1/conversation/list", [=](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    std::string user;
    if (!resolve_user(req, res, &user)) return;
    ListQuery q;
    q.user_id = user;
    if (!ParseIntParam(req, "limit", &q.limit) || !ParseIntParam(req, "offset", &q.offset)) {
      return SendBadRequest(&res, "limit and offset must be integers");
    }
    if (req.has_param("order_by")) q.order_by = req.get_param_value("order_by");
    if (req.has_param("order")) q.order = req.get_param_value("order");
    Error err;
    auto page = conversations_->List(q, &err);
    if (!page) return SendError(&res, err);
    nlohmann::json out;
    out["datas"] = nlohmann::json::array();
    for (const auto& r : page->items) out["datas"].push_back(RecordToJson(r, false));
    out["limit"] = page->limit;
    out["offset"] = page->offset;
    out["has_more"] = page->has_more;
    SendJson(&res, 200, out);
  });

  server->Get(R"(/api/v1/conversation/info/([^/]+))", [=](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    std::string user;
    if (!resolve_user(req, res, &user)) return;
    Error err;
    auto r = conversations_->Info(user, req.matches[1], &err);
    if (!r) return SendError(&res, err);
    SendJson(&res, 200, RecordToJson(*r, true));
  });

  server->Post(R"(/api/v1/conversation/delete/([^/]+))", [=](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    std::string user;
    if (!resolve_user(req, res, &user)) return;
    Error err;
    if (!conversations_->Delete(user, req.matches[1], &err)) return SendError(&res, err);
    res.status = 204;
  });

  server->Post(R"(/api/v1/conversation/chat/([^/]+))", [=](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    std::string user;
    if (!resolve_user(req, res, &user)) return;
    auto body = ParseJsonBody(req);
    if (body.is_discarded() || !body.is_object()) return SendBadRequest(&res, "invalid json body");
    if (!body.contains("prompt") || !body["prompt"].is_string()) return SendBadRequest(&res, "missing field: prompt");
    ChatParams params;
    params.prompt = body["prompt"].get<std::string>();
    if (body.contains("system_prompt") && body["system_prompt"].is_string()) {
      params.system_prompt = body["system_prompt"].get<std::string>();
    }
    std::string perr;
    if (!ParseOptionalMessages(body, &params.redacted_messages, &perr)) {
      return SendBadRequest(&res, "invalid redacted_messages: " + perr);
    }
    params.settings = ParseSettings(body);
    Error err;
    auto stream_id = conversations_->Chat(user, req.matches[1], params, &err);
    if (!stream_id) return SendError(&res, err);
    SendJson(&res, 200, {{"stream_id", *stream_id}});
  });

  server->Post(R"(/api/v1/conversation/permit-call-tool/([^/]+))",
               [=](const httplib::Request& req, httplib::Response& res) {
                 LogRequest(req);
                 std::string user;
                 if (!resolve_user(req, res, &user)) return;
                 auto body = ParseJsonBody(req);
                 if (body.is_discarded() || !body.is_object()) return SendBadRequest(&res, "invalid json body");
                 PermitParams params;
                 if (body.contains("execute_all_tool_calls") && body["execute_all_tool_calls"].is_boolean()) {
                   params.decision.run_all = body["execute_all_tool_calls"].get<bool>();
                 }
                 if (body.contains("execute_tool_call_ids") && !body["execute_tool_call_ids"].is_null()) {
                   if (!body["execute_tool_call_ids"].is_array()) {
                     return SendBadRequest(&res, "execute_tool_call_ids must be an array of strings");
                   }
                   for (const auto& id : body["execute_tool_call_ids"]) {
                     if (!id.is_string()) return SendBadRequest(&res, "execute_tool_call_ids must be an array of strings");
                     params.decision.tool_call_ids.push_back(id.get<std::string>());
                   }
                 }
                 if (body.contains("execute_tool_call_part") && !body["execute_tool_call_part"].is_null()) {
                   if (!body["execute_tool_call_part"].is_array()) {
                     return SendBadRequest(&res, "execute_tool_call_part must be an array of tool-call parts");
                   }
                   for (const auto& pj : body["execute_tool_call_part"]) {
                     MessagePart p;
                     std::string perr;
                     if (!PartFromJson(pj, &p, &perr)) return SendBadRequest(&res, "invalid tool-call part: " + perr);
                     params.decision.edited_calls.push_back(std::move(p));
                   }
                 }
                 std::string perr;
                 if (!ParseOptionalMessages(body, &params.redacted_messages, &perr)) {
                   return SendBadRequest(&res, "invalid redacted_messages: " + perr);
                 }
                 params.settings = ParseSettings(body);
                 Error err;
                 auto stream_id = conversations_->Permit(user, req.matches[1], params, &err);
                 if (!stream_id) return SendError(&res, err);
                 SendJson(&res, 200, {{"stream_id", *stream_id}});
               });

  server->Post(R"(/api/v1/conversation/resume/([^/]+))", [=](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    std::string user;
    if (!resolve_user(req, res, &user)) return;
    auto body = ParseJsonBody(req);
    if (body.is_discarded() || !body.is_object()) return SendBadRequest(&res, "invalid json body");
    Error err;
    auto stream_id = conversations_->Resume(user, req.matches[1], ParseSettings(body), &err);
    if (!stream_id) return SendError(&res, err);
    SendJson(&res, 200, {{"stream_id", *stream_id}});
  });

  server->Get(R"(/api/v1/stream/([^/]+))", [=](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    const std::string stream_id = req.matches[1];
    int index = 0;
    if (!ParseIntParam(req, "index", &index) || index < 0) {
      return SendBadRequest(&res, "index must be a non-negative integer");
    }
    Error err;
    auto reader = streams_->Subscribe(stream_id, static_cast<size_t>(index), &err);
    if (!reader) return SendError(&res, err);

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    auto shared_reader = std::make_shared<StreamReader>(std::move(*reader));
    res.set_chunked_content_provider(
        "text/event-stream", [this, stream_id, shared_reader](size_t, httplib::DataSink& sink) {
          auto write_bytes = [&sink](const std::string& s) -> bool {
            if (sink.is_writable && !sink.is_writable()) return false;
            if (!sink.write) return false;
            return sink.write(s.data(), s.size());
          };
          if (WriteStreamEvents(shared_reader.get(), options_.keepalive, write_bytes) == SseOutcome::kConsumerGone) {
            std::cout << "[stream] id=" << stream_id << " consumer left at index=" << shared_reader->Position() << "\n";
            return false;
          }
          streams_->MarkTerminalRead(stream_id);
          sink.done();
          return true;
        });
  });

  server->Get("/api/v1/mcp/servers", [=](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    SendJson(&res, 200, conversations_->ToolServers());
  });

  server->Post("/internal/refresh_mcp_tools", [=](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    nlohmann::json out;
    if (!tools_) {
      out["ok"] = true;
      out["errors"] = nlohmann::json::object();
      return SendJson(&res, 200, out);
    }
    auto errors = tools_->RefreshTools();
    out["ok"] = errors.empty();
    out["errors"] = nlohmann::json::object();
    for (const auto& kv : errors) out["errors"][kv.first] = kv.second;
    out["servers"] = tools_->DescribeJson();
    SendJson(&res, 200, out);
  });
}

}  // namespace floword
