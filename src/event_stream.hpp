#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace floword {

enum class ReadStatus {
  kEvent,
  kTimeout,
  kEnd,
};

class StreamReader;

// Append-only event buffer for one exchange. Indices are absolute: evicting the oldest event never renumbers the
// rest. One producer, any number of readers.
class EventStream : public std::enable_shared_from_this<EventStream> {
 public:
  EventStream(std::string id, size_t capacity);

  const std::string& Id() const { return id_; }

  // Returns false once the stream is completed.
  bool AddEvent(nlohmann::json event);
  void MarkCompleted();
  bool IsCompleted() const;

  // Index the next event will get.
  size_t Size() const;
  // Index of the oldest retained event.
  size_t FirstIndex() const;
  std::vector<nlohmann::json> GetEvents(size_t from_index) const;

  StreamReader Subscribe(size_t from_index);

  int64_t CreatedAtMs() const { return created_at_ms_; }
  std::optional<std::chrono::steady_clock::time_point> CompletedAt() const;

 private:
  friend class StreamReader;

  ReadStatus WaitNext(size_t* cursor, nlohmann::json* out, std::chrono::milliseconds timeout, size_t* lost);

  const std::string id_;
  const size_t capacity_;
  const int64_t created_at_ms_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<nlohmann::json> events_;
  size_t first_index_ = 0;
  bool completed_ = false;
  std::chrono::steady_clock::time_point completed_at_;
};

// A cursor over one EventStream. Dropping it never affects the producer or other readers.
class StreamReader {
 public:
  StreamReader(std::shared_ptr<EventStream> stream, size_t from_index);

  // kEvent fills *out. kTimeout means nothing new within timeout. kEnd means the stream is completed and drained.
  ReadStatus Next(nlohmann::json* out, std::chrono::milliseconds timeout);

  size_t Position() const { return cursor_; }
  // Events skipped because they were evicted before this reader got to them.
  size_t Lost() const { return lost_; }
  const std::shared_ptr<EventStream>& Stream() const { return stream_; }

 private:
  std::shared_ptr<EventStream> stream_;
  size_t cursor_ = 0;
  size_t lost_ = 0;
};

struct StreamRegistryOptions {
  size_t capacity = 1000;
  // Retention after the terminal read. Zero removes the stream immediately.
  std::chrono::milliseconds grace{std::chrono::seconds(30)};
  // Retention of completed streams nobody finished reading.
  std::chrono::milliseconds abandoned{std::chrono::seconds(3600)};
};

class StreamRegistry {
 public:
  explicit StreamRegistry(StreamRegistryOptions options = {});

  std::shared_ptr<EventStream> Create(const std::string& id, Error* err);
  std::shared_ptr<EventStream> Get(const std::string& id, Error* err);
  std::shared_ptr<EventStream> GetOrCreate(const std::string& id);
  std::optional<StreamReader> Subscribe(const std::string& id, size_t from_index, Error* err);

  bool Has(const std::string& id);
  bool Delete(const std::string& id);

  // Called after a consumer read the end of a completed stream.
  void MarkTerminalRead(const std::string& id);

  // Drops streams whose grace window or abandoned TTL has passed. Returns how many were removed.
  size_t Sweep();
  size_t Count() const;

  const StreamRegistryOptions& Options() const { return options_; }

 private:
  struct Entry {
    std::shared_ptr<EventStream> stream;
    std::optional<std::chrono::steady_clock::time_point> terminal_read_at;
  };

  size_t SweepLocked(std::chrono::steady_clock::time_point now);

  StreamRegistryOptions options_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> streams_;
};

}  // namespace floword
