#include "conversation_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace floword {
namespace {

static std::string GetString(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

static int64_t GetInt(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_number_integer()) return j[key].get<int64_t>();
  return 0;
}

}  // namespace

nlohmann::json RecordToJson(const ConversationRecord& record, bool include_messages) {
  nlohmann::json j;
  j["conversation_id"] = record.conversation_id;
  j["title"] = record.title;
  j["usage"] = UsageToJson(record.usage);
  j["created_at"] = record.created_at;
  j["updated_at"] = record.updated_at;
  j["messages"] = include_messages ? MessagesToJson(record.messages) : nlohmann::json();
  return j;
}

std::optional<ConversationRecord> RecordFromJson(const nlohmann::json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "record is not an object";
    return std::nullopt;
  }
  ConversationRecord r;
  r.conversation_id = GetString(j, "conversation_id");
  if (r.conversation_id.empty()) {
    if (err) *err = "record has no conversation_id";
    return std::nullopt;
  }
  r.user_id = GetString(j, "user_id");
  if (auto title = GetString(j, "title"); !title.empty()) r.title = title;
  auto messages = MessagesFromJson(j.contains("messages") ? j["messages"] : nlohmann::json(), err);
  if (!messages) return std::nullopt;
  r.messages = std::move(*messages);
  if (j.contains("usage")) r.usage = UsageFromJson(j["usage"]);
  r.created_at = GetInt(j, "created_at");
  r.updated_at = GetInt(j, "updated_at");
  return r;
}

std::optional<ConversationRecord> MemoryConversationStore::Get(const std::string& conversation_id, Error* err) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = records_.find(conversation_id);
  if (it == records_.end()) {
    SetError(err, ErrorKind::kConversationNotFound, "conversation not found: " + conversation_id);
    return std::nullopt;
  }
  return it->second;
}

ConversationRecord MemoryConversationStore::Create(const std::string& user_id) {
  ConversationRecord r;
  r.conversation_id = NewId("conv");
  r.user_id = user_id;
  r.created_at = NowMillis();
  r.updated_at = r.created_at;
  std::lock_guard<std::mutex> lock(mu_);
  records_[r.conversation_id] = r;
  // The record stays usable in memory; the next successful write persists it.
  Error err;
  if (!OnChangedLocked(&err)) {
    std::cout << "[store] create not persisted id=" << r.conversation_id << ": " << err.message << "\n";
  }
  return r;
}

bool MemoryConversationStore::Update(const std::string& conversation_id,
                                     const std::vector<ModelMessage>& messages,
                                     const Usage& usage,
                                     Error* err) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = records_.find(conversation_id);
  if (it == records_.end()) {
    SetError(err, ErrorKind::kConversationNotFound, "conversation not found: " + conversation_id);
    return false;
  }
  auto previous = it->second;
  it->second.messages = messages;
  it->second.usage = usage;
  // Keep updated_at strictly increasing so ordering by it is stable within one millisecond.
  it->second.updated_at = std::max(NowMillis(), it->second.updated_at + 1);
  if (!OnChangedLocked(err)) {
    it->second = std::move(previous);
    return false;
  }
  return true;
}

bool MemoryConversationStore::Delete(const std::string& conversation_id, Error* err) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = records_.find(conversation_id);
  if (it == records_.end()) {
    SetError(err, ErrorKind::kConversationNotFound, "conversation not found: " + conversation_id);
    return false;
  }
  auto removed = std::move(it->second);
  records_.erase(it);
  if (!OnChangedLocked(err)) {
    records_[conversation_id] = std::move(removed);
    return false;
  }
  return true;
}

std::optional<ConversationPage> MemoryConversationStore::List(const ListQuery& query, Error* err) {
  if (query.order != "asc" && query.order != "desc") {
    SetError(err, ErrorKind::kInvalidRequest, "order must be 'asc' or 'desc'");
    return std::nullopt;
  }
  if (query.order_by != "created_at" && query.order_by != "updated_at") {
    SetError(err, ErrorKind::kInvalidRequest, "order_by must be 'created_at' or 'updated_at'");
    return std::nullopt;
  }
  if (query.limit <= 0) {
    SetError(err, ErrorKind::kInvalidRequest, "limit must be positive");
    return std::nullopt;
  }
  if (query.offset < 0) {
    SetError(err, ErrorKind::kInvalidRequest, "offset must not be negative");
    return std::nullopt;
  }

  std::vector<ConversationRecord> mine;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& kv : records_) {
      if (kv.second.user_id == query.user_id) mine.push_back(kv.second);
    }
  }
  const bool by_created = query.order_by == "created_at";
  const bool asc = query.order == "asc";
  std::sort(mine.begin(), mine.end(), [&](const ConversationRecord& a, const ConversationRecord& b) {
    const auto ka = by_created ? a.created_at : a.updated_at;
    const auto kb = by_created ? b.created_at : b.updated_at;
    if (ka != kb) return asc ? ka < kb : ka > kb;
    return asc ? a.conversation_id < b.conversation_id : a.conversation_id > b.conversation_id;
  });

  ConversationPage page;
  page.limit = query.limit;
  page.offset = query.offset;
  for (size_t i = static_cast<size_t>(query.offset); i < mine.size() && page.items.size() < static_cast<size_t>(query.limit);
       i++) {
    page.items.push_back(std::move(mine[i]));
  }
  page.has_more = static_cast<size_t>(query.offset) + page.items.size() < mine.size();
  return page;
}

FileConversationStore::FileConversationStore(std::string path) : path_(std::move(path)) { LoadAll(); }

void FileConversationStore::LoadAll() {
  std::filesystem::path p(path_);
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return;
  std::ifstream in(p, std::ios::binary);
  if (!in) return;
  std::stringstream ss;
  ss << in.rdbuf();
  auto j = nlohmann::json::parse(ss.str(), nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("conversations") || !j["conversations"].is_object()) {
    std::cout << "[store] ignoring unreadable snapshot path=" << path_ << "\n";
    return;
  }
  std::lock_guard<std::mutex> lock(mu_);
  for (auto it = j["conversations"].begin(); it != j["conversations"].end(); ++it) {
    std::string err;
    auto r = RecordFromJson(it.value(), &err);
    if (!r) {
      std::cout << "[store] skipping conversation " << it.key() << ": " << err << "\n";
      continue;
    }
    records_[r->conversation_id] = std::move(*r);
  }
  std::cout << "[store] loaded conversations=" << records_.size() << " path=" << path_ << "\n";
}

bool FileConversationStore::OnChangedLocked(Error* err) {
  nlohmann::json out;
  out["conversations"] = nlohmann::json::object();
  for (const auto& kv : records_) {
    auto rj = RecordToJson(kv.second, true);
    rj["user_id"] = kv.second.user_id;
    out["conversations"][kv.first] = std::move(rj);
  }

  std::filesystem::path path(path_);
  std::error_code ec;
  auto dir = path.parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      std::cout << "[store] cannot write " << tmp.string() << "\n";
      SetError(err, ErrorKind::kStorage, "cannot write conversation snapshot: " + tmp.string());
      return false;
    }
    f << out.dump();
    f.flush();
    if (!f) {
      std::cout << "[store] write failed " << tmp.string() << "\n";
      f.close();
      std::filesystem::remove(tmp, ec);
      SetError(err, ErrorKind::kStorage, "write failed for conversation snapshot: " + tmp.string());
      return false;
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::cout << "[store] rename failed path=" << path_ << " error=" << ec.message() << "\n";
    SetError(err, ErrorKind::kStorage, "cannot replace conversation snapshot " + path_ + ": " + ec.message());
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    return false;
  }
  return true;
}

std::unique_ptr<ConversationStore> MakeConversationStore(const RuntimeConfig& cfg) {
  if (cfg.conversation_store_type == "file") {
    auto path = cfg.conversation_store_path.empty() ? std::string("./floword_conversations.json")
                                                    : cfg.conversation_store_path;
    return std::make_unique<FileConversationStore>(path);
  }
  return std::make_unique<MemoryConversationStore>();
}

}  // namespace floword
