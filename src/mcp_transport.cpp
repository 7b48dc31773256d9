#include "mcp_transport.hpp"

#include "config.hpp"

#include <httplib.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <utility>

extern char** environ;

namespace floword {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string TrimLine(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\r')) start++;
  size_t end = s.size();
  while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r')) end--;
  return s.substr(start, end - start);
}

static bool ReadStringMap(const nlohmann::json& j,
                          const char* field,
                          std::map<std::string, std::string>* out,
                          std::string* err) {
  if (!j.contains(field) || j[field].is_null()) return true;
  if (!j[field].is_object()) {
    if (err) *err = std::string(field) + " must be an object of strings";
    return false;
  }
  for (auto it = j[field].begin(); it != j[field].end(); ++it) {
    if (!it.value().is_string()) {
      if (err) *err = std::string(field) + "." + it.key() + " must be a string";
      return false;
    }
    (*out)[it.key()] = it.value().get<std::string>();
  }
  return true;
}

static bool ReadSeconds(const nlohmann::json& j, const char* field, const char* alias, int* out, std::string* err) {
  const char* key = j.contains(field) ? field : (j.contains(alias) ? alias : nullptr);
  if (!key || j[key].is_null()) return true;
  if (!j[key].is_number()) {
    if (err) *err = std::string(key) + " must be a number of seconds";
    return false;
  }
  const double v = j[key].get<double>();
  if (v <= 0) {
    if (err) *err = std::string(key) + " must be positive";
    return false;
  }
  *out = v < 1.0 ? 1 : static_cast<int>(v);
  return true;
}

static nlohmann::json ErrorResponse(const nlohmann::json& id, const std::string& message) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["error"] = {{"code", -32000}, {"message", message}};
  return j;
}

static std::once_flag g_sigpipe_once;

static void IgnoreSigpipe() {
  std::call_once(g_sigpipe_once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

static void CloseFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

static httplib::Headers ToHeaders(const std::map<std::string, std::string>& m) {
  httplib::Headers headers;
  for (const auto& kv : m) headers.emplace(kv.first, kv.second);
  return headers;
}

static std::string Origin(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port);
}

}  // namespace

bool ParseServerParams(const nlohmann::json& j, ServerParams* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "server entry must be an object";
    return false;
  }
  ServerParams p;
  if (j.contains("transport") && !j["transport"].is_null()) {
    if (!j["transport"].is_string()) {
      if (err) *err = "transport must be a string";
      return false;
    }
    const auto t = j["transport"].get<std::string>();
    if (t == "stdio") {
      p.transport = TransportKind::kStdio;
    } else if (t == "sse") {
      p.transport = TransportKind::kSse;
    } else {
      if (err) *err = "unsupported transport: " + t;
      return false;
    }
  } else if (j.contains("url")) {
    p.transport = TransportKind::kSse;
  } else if (j.contains("command")) {
    p.transport = TransportKind::kStdio;
  } else {
    if (err) *err = "server entry needs either command or url";
    return false;
  }

  if (p.transport == TransportKind::kStdio) {
    if (!j.contains("command") || !j["command"].is_string() || j["command"].get<std::string>().empty()) {
      if (err) *err = "stdio server requires a non-empty command";
      return false;
    }
    p.command = j["command"].get<std::string>();
    if (j.contains("args") && !j["args"].is_null()) {
      if (!j["args"].is_array()) {
        if (err) *err = "args must be an array of strings";
        return false;
      }
      for (const auto& a : j["args"]) {
        if (!a.is_string()) {
          if (err) *err = "args must be an array of strings";
          return false;
        }
        p.args.push_back(a.get<std::string>());
      }
    }
    if (!ReadStringMap(j, "env", &p.env, err)) return false;
  } else {
    if (!j.contains("url") || !j["url"].is_string()) {
      if (err) *err = "sse server requires a url";
      return false;
    }
    p.url = j["url"].get<std::string>();
    if (!StartsWith(p.url, "http://") && !StartsWith(p.url, "https://")) {
      if (err) *err = "sse url must start with http:// or https://";
      return false;
    }
    if (!ReadStringMap(j, "headers", &p.headers, err)) return false;
    if (!ReadSeconds(j, "timeout", "connectTimeout", &p.connect_timeout_seconds, err)) return false;
    if (!ReadSeconds(j, "sse_read_timeout", "readTimeout", &p.read_timeout_seconds, err)) return false;
  }
  *out = std::move(p);
  return true;
}

nlohmann::json ServerParamsToJson(const ServerParams& params) {
  nlohmann::json j;
  if (params.transport == TransportKind::kStdio) {
    j["transport"] = "stdio";
    j["command"] = params.command;
    j["args"] = params.args;
    nlohmann::json env = nlohmann::json::object();
    for (const auto& kv : params.env) env[kv.first] = "<redacted>";
    j["env"] = std::move(env);
  } else {
    j["transport"] = "sse";
    j["url"] = params.url;
    nlohmann::json headers = nlohmann::json::object();
    for (const auto& kv : params.headers) headers[kv.first] = "<redacted>";
    j["headers"] = std::move(headers);
    j["timeout"] = params.connect_timeout_seconds;
    j["sse_read_timeout"] = params.read_timeout_seconds;
  }
  return j;
}

std::unique_ptr<McpTransport> MakeTransport(const ServerParams& params) {
  if (params.transport == TransportKind::kSse) return std::make_unique<SseTransport>(params);
  return std::make_unique<StdioTransport>(params);
}

std::future<nlohmann::json> PendingRequests::Add(const nlohmann::json& id) {
  std::promise<nlohmann::json> promise;
  auto fut = promise.get_future();
  std::lock_guard<std::mutex> lock(mu_);
  if (failed_reason_) {
    promise.set_value(ErrorResponse(id, *failed_reason_));
    return fut;
  }
  waiting_[id.dump()] = std::move(promise);
  return fut;
}

void PendingRequests::Remove(const nlohmann::json& id) {
  std::lock_guard<std::mutex> lock(mu_);
  waiting_.erase(id.dump());
}

bool PendingRequests::Resolve(const nlohmann::json& response) {
  if (!response.is_object() || !response.contains("id")) return false;
  std::promise<nlohmann::json> promise;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = waiting_.find(response["id"].dump());
    if (it == waiting_.end()) return false;
    promise = std::move(it->second);
    waiting_.erase(it);
  }
  promise.set_value(response);
  return true;
}

void PendingRequests::FailAll(const std::string& reason) {
  std::unordered_map<std::string, std::promise<nlohmann::json>> waiting;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!failed_reason_) failed_reason_ = reason;
    waiting.swap(waiting_);
  }
  for (auto& kv : waiting) {
    auto id = nlohmann::json::parse(kv.first, nullptr, false);
    kv.second.set_value(ErrorResponse(id.is_discarded() ? nlohmann::json() : id, reason));
  }
}

bool IsJsonRpcResponse(const nlohmann::json& message) {
  return message.is_object() && message.contains("id") && !message.contains("method") &&
         (message.contains("result") || message.contains("error"));
}

bool IsJsonRpcRequest(const nlohmann::json& message) {
  return message.is_object() && message.contains("id") && message.contains("method") && message["method"].is_string();
}

nlohmann::json ReplyToServerRequest(const nlohmann::json& request) {
  nlohmann::json reply;
  reply["jsonrpc"] = "2.0";
  reply["id"] = request["id"];
  if (request["method"].get<std::string>() == "ping") {
    reply["result"] = nlohmann::json::object();
  } else {
    reply["error"] = {{"code", -32601}, {"message", "method not found"}};
  }
  return reply;
}

// ---------------------------------------------------------------------------
// stdio

StdioTransport::StdioTransport(ServerParams params) : params_(std::move(params)) {}

StdioTransport::~StdioTransport() { Close(); }

bool StdioTransport::Start(std::string* err) {
  IgnoreSigpipe();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
      CloseFd(&p[0]);
      CloseFd(&p[1]);
    }
  };
  if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    if (err) *err = std::string("mcp: pipe failed: ") + std::strerror(errno);
    close_all();
    return false;
  }

  // Everything the child needs is built before fork.
  std::vector<std::string> argv_strings;
  argv_strings.push_back(params_.command);
  for (const auto& a : params_.args) argv_strings.push_back(a);
  std::vector<char*> argv;
  for (auto& s : argv_strings) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> env_strings;
  for (char** e = environ; e && *e; ++e) {
    std::string kv(*e);
    auto eq = kv.find('=');
    if (eq != std::string::npos && params_.env.count(kv.substr(0, eq))) continue;
    env_strings.push_back(std::move(kv));
  }
  for (const auto& kv : params_.env) env_strings.push_back(kv.first + "=" + kv.second);
  std::vector<char*> envp;
  for (auto& s : env_strings) envp.push_back(s.data());
  envp.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    if (err) *err = std::string("mcp: fork failed: ") + std::strerror(errno);
    close_all();
    return false;
  }
  if (pid == 0) {
    // The server blocks its stop signals in every thread; the child must not inherit that.
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvpe(argv[0], argv.data(), envp.data());
    int code = errno;
    ssize_t ignored = ::write(exec_pipe[1], &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  }

  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&exec_pipe[1]);

  // exec_pipe is close-on-exec: EOF means exec succeeded, an int means it failed.
  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&exec_pipe[0]);
  if (n > 0) {
    ::waitpid(pid, nullptr, 0);
    CloseFd(&in_pipe[1]);
    CloseFd(&out_pipe[0]);
    CloseFd(&err_pipe[0]);
    if (err) *err = "mcp: failed to start '" + params_.command + "': " + std::strerror(exec_errno);
    return false;
  }

  pid_ = pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    alive_ = true;
  }
  std::cout << "[mcp] spawned pid=" << pid_ << " command=" << params_.command << "\n";
  reader_ = std::thread(&StdioTransport::ReadLoop, this);
  return true;
}

bool StdioTransport::IsAlive() {
  std::lock_guard<std::mutex> lock(state_mu_);
  return alive_ && !closed_;
}

bool StdioTransport::WriteLine(const std::string& line, std::string* err) {
  std::lock_guard<std::mutex> lock(write_mu_);
  if (stdin_fd_ < 0) {
    if (err) *err = "mcp: transport closed";
    return false;
  }
  std::string data = line + "\n";
  size_t off = 0;
  while (off < data.size()) {
    ssize_t w = ::write(stdin_fd_, data.data() + off, data.size() - off);
    if (w < 0) {
      if (errno == EINTR) continue;
      if (err) *err = std::string("mcp: write failed: ") + std::strerror(errno);
      return false;
    }
    off += static_cast<size_t>(w);
  }
  return true;
}

std::optional<nlohmann::json> StdioTransport::Request(const nlohmann::json& request, std::string* err) {
  if (!IsAlive()) {
    if (err) *err = "mcp: transport not running";
    return std::nullopt;
  }
  const nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json();
  auto fut = pending_.Add(id);
  if (!WriteLine(request.dump(), err)) {
    pending_.Remove(id);
    return std::nullopt;
  }
  if (fut.wait_for(std::chrono::seconds(params_.read_timeout_seconds)) != std::future_status::ready) {
    pending_.Remove(id);
    if (err) *err = "mcp: timed out waiting for response";
    return std::nullopt;
  }
  return fut.get();
}

bool StdioTransport::Notify(const nlohmann::json& notification, std::string* err) {
  if (!IsAlive()) {
    if (err) *err = "mcp: transport not running";
    return false;
  }
  return WriteLine(notification.dump(), err);
}

void StdioTransport::HandleLine(const std::string& raw) {
  const auto line = TrimLine(raw);
  if (line.empty()) return;
  auto msg = nlohmann::json::parse(line, nullptr, false);
  if (msg.is_discarded()) {
    std::cout << "[mcp] pid=" << pid_ << " ignored non-json line: " << line.substr(0, 200) << "\n";
    return;
  }
  if (IsJsonRpcResponse(msg)) {
    pending_.Resolve(msg);
  } else if (IsJsonRpcRequest(msg)) {
    std::string err;
    if (!WriteLine(ReplyToServerRequest(msg).dump(), &err)) {
      std::cout << "[mcp] pid=" << pid_ << " reply failed: " << err << "\n";
    }
  }
}

void StdioTransport::ReadLoop() {
  std::string out_buf;
  std::string err_buf;
  char chunk[4096];
  bool stdout_open = true;
  bool stderr_open = stderr_fd_ >= 0;
  while (stdout_open) {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (closed_) break;
    }
    pollfd fds[2];
    nfds_t nfds = 0;
    fds[nfds++] = {stdout_fd_, POLLIN, 0};
    if (stderr_open) fds[nfds++] = {stderr_fd_, POLLIN, 0};
    int rc = ::poll(fds, nfds, 200);
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (rc == 0) continue;

    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
      if (n > 0) {
        out_buf.append(chunk, static_cast<size_t>(n));
        size_t pos = 0;
        while ((pos = out_buf.find('\n')) != std::string::npos) {
          auto line = out_buf.substr(0, pos);
          out_buf.erase(0, pos + 1);
          HandleLine(line);
        }
      } else if (n == 0 || errno != EINTR) {
        stdout_open = false;
      }
    }
    if (nfds > 1 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
      ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
      if (n > 0) {
        err_buf.append(chunk, static_cast<size_t>(n));
        size_t pos = 0;
        while ((pos = err_buf.find('\n')) != std::string::npos) {
          std::cout << "[mcp-stderr] pid=" << pid_ << " " << err_buf.substr(0, pos) << "\n";
          err_buf.erase(0, pos + 1);
        }
      } else if (n == 0 || errno != EINTR) {
        stderr_open = false;
      }
    }
  }
  if (!out_buf.empty()) HandleLine(out_buf);
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    alive_ = false;
  }
  pending_.FailAll("mcp: tool server process exited");
}

void StdioTransport::Close() {
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (closed_) return;
    closed_ = true;
  }
  {
    std::lock_guard<std::mutex> lock(write_mu_);
    CloseFd(&stdin_fd_);
  }
  if (pid_ > 0) {
    ::kill(pid_, SIGTERM);
    bool reaped = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
      pid_t r = ::waitpid(pid_, nullptr, WNOHANG);
      if (r == pid_ || (r < 0 && errno == ECHILD)) {
        reaped = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!reaped) {
      ::kill(pid_, SIGKILL);
      ::waitpid(pid_, nullptr, 0);
    }
    std::cout << "[mcp] stopped pid=" << pid_ << "\n";
    pid_ = -1;
  }
  if (reader_.joinable()) reader_.join();
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
  pending_.FailAll("mcp: transport closed");
}

// ---------------------------------------------------------------------------
// sse

struct SseTransport::StreamState {
  std::mutex mu;
  std::condition_variable cv;
  bool endpoint_ready = false;
  bool ended = false;
  bool closing = false;
  std::string end_reason;
  HttpEndpoint origin;
  std::string post_origin;
  std::string post_path;
  httplib::Client* client = nullptr;
  PendingRequests pending;
};

namespace {

static bool PostMessage(const std::shared_ptr<SseTransport::StreamState>& state,
                        const ServerParams& params,
                        const nlohmann::json& message,
                        std::string* err);

static void HandleSseFrame(const std::shared_ptr<SseTransport::StreamState>& state,
                           const ServerParams& params,
                           const std::string& event,
                           const std::string& data) {
  if (event == "endpoint") {
    const auto target = TrimLine(data);
    std::lock_guard<std::mutex> lock(state->mu);
    if (StartsWith(target, "http://") || StartsWith(target, "https://")) {
      auto ep = ParseHttpEndpoint(target, 80);
      state->post_origin = Origin(ep);
      state->post_path = ep.base_path.empty() ? "/" : ep.base_path;
    } else if (StartsWith(target, "/")) {
      state->post_origin = Origin(state->origin);
      state->post_path = target;
    } else {
      auto dir = state->origin.base_path;
      auto q = dir.find('?');
      if (q != std::string::npos) dir.resize(q);
      auto slash = dir.rfind('/');
      dir = slash == std::string::npos ? "/" : dir.substr(0, slash + 1);
      state->post_origin = Origin(state->origin);
      state->post_path = dir + target;
    }
    state->endpoint_ready = true;
    state->cv.notify_all();
    return;
  }
  if (!event.empty() && event != "message") return;
  auto msg = nlohmann::json::parse(data, nullptr, false);
  if (msg.is_discarded()) {
    std::cout << "[mcp] sse url=" << params.url << " ignored non-json message\n";
    return;
  }
  if (IsJsonRpcResponse(msg)) {
    state->pending.Resolve(msg);
  } else if (IsJsonRpcRequest(msg)) {
    std::string err;
    if (!PostMessage(state, params, ReplyToServerRequest(msg), &err)) {
      std::cout << "[mcp] sse url=" << params.url << " reply failed: " << err << "\n";
    }
  }
}

static void ConsumeSseBuffer(const std::shared_ptr<SseTransport::StreamState>& state,
                             const ServerParams& params,
                             std::string* buffer) {
  size_t pos = 0;
  while ((pos = buffer->find("\n\n")) != std::string::npos) {
    const auto frame = buffer->substr(0, pos);
    buffer->erase(0, pos + 2);
    std::string event;
    std::string data;
    bool has_data = false;
    size_t start = 0;
    while (start <= frame.size()) {
      auto end = frame.find('\n', start);
      if (end == std::string::npos) end = frame.size();
      const auto line = frame.substr(start, end - start);
      start = end + 1;
      if (line.empty() || line[0] == ':') continue;
      auto colon = line.find(':');
      const auto field = line.substr(0, colon);
      std::string value = colon == std::string::npos ? std::string() : line.substr(colon + 1);
      if (!value.empty() && value[0] == ' ') value.erase(0, 1);
      if (field == "event") {
        event = value;
      } else if (field == "data") {
        if (has_data) data += "\n";
        data += value;
        has_data = true;
      }
    }
    if (has_data) HandleSseFrame(state, params, event, data);
  }
}

static bool PostMessage(const std::shared_ptr<SseTransport::StreamState>& state,
                        const ServerParams& params,
                        const nlohmann::json& message,
                        std::string* err) {
  std::string origin;
  std::string path;
  {
    std::lock_guard<std::mutex> lock(state->mu);
    if (!state->endpoint_ready) {
      if (err) *err = "mcp: sse endpoint not announced";
      return false;
    }
    origin = state->post_origin;
    path = state->post_path;
  }
  httplib::Client cli(origin);
  if (!cli.is_valid()) {
    if (err) *err = "mcp: invalid message endpoint " + origin;
    return false;
  }
  cli.set_connection_timeout(params.connect_timeout_seconds);
  cli.set_read_timeout(params.read_timeout_seconds);
  auto res = cli.Post(path, ToHeaders(params.headers), message.dump(), "application/json");
  if (!res) {
    if (err) *err = "mcp: post failed: " + httplib::to_string(res.error());
    return false;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "mcp: http " + std::to_string(res->status);
    return false;
  }
  // Some servers answer on the POST itself instead of the event stream.
  if (!res->body.empty()) {
    auto body = nlohmann::json::parse(res->body, nullptr, false);
    if (!body.is_discarded() && IsJsonRpcResponse(body)) state->pending.Resolve(body);
  }
  return true;
}

}  // namespace

SseTransport::SseTransport(ServerParams params)
    : params_(std::move(params)), state_(std::make_shared<StreamState>()) {}

SseTransport::~SseTransport() { Close(); }

bool SseTransport::Start(std::string* err) {
  auto ep = ParseHttpEndpoint(params_.url, 80);
  state_->origin = ep;
  if (stream_thread_.joinable()) {
    if (err) *err = "mcp: sse transport already started";
    return false;
  }

  // The thread only touches the shared state, so Close may detach it if the stream refuses to stop.
  stream_thread_ = std::thread([state = state_, params = params_, ep]() {
    httplib::Client cli(Origin(ep));
    std::string reason;
    if (!cli.is_valid()) {
      reason = "mcp: invalid sse url " + params.url;
    } else {
      cli.set_connection_timeout(params.connect_timeout_seconds);
      cli.set_read_timeout(params.read_timeout_seconds);
      bool closing = false;
      {
        std::lock_guard<std::mutex> lock(state->mu);
        closing = state->closing;
        if (!closing) state->client = &cli;
      }
      if (closing) {
        reason = "mcp: transport closed";
      } else {
        auto headers = ToHeaders(params.headers);
        headers.emplace("Accept", "text/event-stream");
        std::string buffer;
        auto res = cli.Get(ep.base_path.empty() ? "/" : ep.base_path, headers,
                           [&](const char* data, size_t len) {
                             for (size_t i = 0; i < len; i++) {
                               if (data[i] != '\r') buffer.push_back(data[i]);
                             }
                             ConsumeSseBuffer(state, params, &buffer);
                             std::lock_guard<std::mutex> lock(state->mu);
                             return !state->closing;
                           });
        if (!res) {
          reason = "mcp: sse connect failed: " + httplib::to_string(res.error());
        } else if (res->status < 200 || res->status >= 300) {
          reason = "mcp: sse http " + std::to_string(res->status);
        } else {
          reason = "mcp: sse stream ended";
        }
      }
    }
    {
      std::lock_guard<std::mutex> lock(state->mu);
      state->client = nullptr;
      state->ended = true;
      state->end_reason = reason;
    }
    state->cv.notify_all();
    state->pending.FailAll(reason);
  });

  std::unique_lock<std::mutex> lock(state_->mu);
  state_->cv.wait_for(lock, std::chrono::seconds(params_.connect_timeout_seconds),
                      [&]() { return state_->endpoint_ready || state_->ended; });
  if (state_->endpoint_ready && !state_->ended) {
    std::cout << "[mcp] sse connected url=" << params_.url << " post=" << state_->post_origin << state_->post_path
              << "\n";
    return true;
  }
  if (err) *err = state_->ended ? state_->end_reason : "mcp: timed out waiting for sse endpoint event";
  return false;
}

std::optional<nlohmann::json> SseTransport::Request(const nlohmann::json& request, std::string* err) {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->ended || state_->closing) {
      if (err) *err = state_->end_reason.empty() ? "mcp: transport closed" : state_->end_reason;
      return std::nullopt;
    }
  }
  const nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json();
  auto fut = state_->pending.Add(id);
  if (!PostMessage(state_, params_, request, err)) {
    state_->pending.Remove(id);
    return std::nullopt;
  }
  if (fut.wait_for(std::chrono::seconds(params_.read_timeout_seconds)) != std::future_status::ready) {
    state_->pending.Remove(id);
    if (err) *err = "mcp: timed out waiting for response";
    return std::nullopt;
  }
  return fut.get();
}

bool SseTransport::Notify(const nlohmann::json& notification, std::string* err) {
  return PostMessage(state_, params_, notification, err);
}

void SseTransport::Close() {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->closing) return;
    state_->closing = true;
    if (state_->client) state_->client->stop();
  }
  if (stream_thread_.joinable()) {
    std::unique_lock<std::mutex> lock(state_->mu);
    const bool ended = state_->cv.wait_for(lock, std::chrono::seconds(2), [&]() { return state_->ended; });
    lock.unlock();
    if (ended) {
      stream_thread_.join();
    } else {
      std::cout << "[mcp] sse url=" << params_.url << " stream did not stop, detaching\n";
      stream_thread_.detach();
    }
  }
  state_->pending.FailAll("mcp: transport closed");
}

}  // namespace floword
