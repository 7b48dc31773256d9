#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "messages.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace floword {

struct ConversationRecord {
  std::string conversation_id;
  std::string user_id;
  std::string title = "Untitled";
  std::vector<ModelMessage> messages;
  Usage usage;
  int64_t created_at = 0;
  int64_t updated_at = 0;
};

nlohmann::json RecordToJson(const ConversationRecord& record, bool include_messages);
std::optional<ConversationRecord> RecordFromJson(const nlohmann::json& j, std::string* err);

struct ListQuery {
  std::string user_id;
  int limit = 100;
  int offset = 0;
  std::string order_by = "created_at";
  std::string order = "desc";
};

struct ConversationPage {
  std::vector<ConversationRecord> items;
  int limit = 0;
  int offset = 0;
  bool has_more = false;
};

class ConversationStore {
 public:
  virtual ~ConversationStore() = default;

  virtual std::optional<ConversationRecord> Get(const std::string& conversation_id, Error* err) = 0;
  virtual ConversationRecord Create(const std::string& user_id) = 0;
  virtual bool Update(const std::string& conversation_id,
                      const std::vector<ModelMessage>& messages,
                      const Usage& usage,
                      Error* err) = 0;
  virtual bool Delete(const std::string& conversation_id, Error* err) = 0;
  virtual std::optional<ConversationPage> List(const ListQuery& query, Error* err) = 0;
};

class MemoryConversationStore : public ConversationStore {
 public:
  std::optional<ConversationRecord> Get(const std::string& conversation_id, Error* err) override;
  ConversationRecord Create(const std::string& user_id) override;
  bool Update(const std::string& conversation_id,
              const std::vector<ModelMessage>& messages,
              const Usage& usage,
              Error* err) override;
  bool Delete(const std::string& conversation_id, Error* err) override;
  std::optional<ConversationPage> List(const ListQuery& query, Error* err) override;

 protected:
  // Called with mu_ held after every mutation. A false return rolls the mutation back.
  virtual bool OnChangedLocked(Error*) { return true; }

  std::mutex mu_;
  std::unordered_map<std::string, ConversationRecord> records_;
};

// Keeps every record in one JSON file, rewritten through a temp file and rename on each change.
class FileConversationStore : public MemoryConversationStore {
 public:
  explicit FileConversationStore(std::string path);

 protected:
  bool OnChangedLocked(Error* err) override;

 private:
  void LoadAll();

  std::string path_;
};

std::unique_ptr<ConversationStore> MakeConversationStore(const RuntimeConfig& cfg);

}  // namespace floword
