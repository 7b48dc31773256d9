#include "event_stream.hpp"

#include "messages.hpp"

#include <iostream>
#include <utility>

namespace floword {

EventStream::EventStream(std::string id, size_t capacity)
    : id_(std::move(id)), capacity_(capacity == 0 ? 1 : capacity), created_at_ms_(NowMillis()) {}

bool EventStream::AddEvent(nlohmann::json event) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (completed_) return false;
    events_.push_back(std::move(event));
    while (events_.size() > capacity_) {
      events_.pop_front();
      first_index_++;
    }
  }
  cv_.notify_all();
  return true;
}

void EventStream::MarkCompleted() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (completed_) return;
    completed_ = true;
    completed_at_ = std::chrono::steady_clock::now();
  }
  cv_.notify_all();
}

bool EventStream::IsCompleted() const {
  std::lock_guard<std::mutex> lock(mu_);
  return completed_;
}

size_t EventStream::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return first_index_ + events_.size();
}

size_t EventStream::FirstIndex() const {
  std::lock_guard<std::mutex> lock(mu_);
  return first_index_;
}

std::vector<nlohmann::json> EventStream::GetEvents(size_t from_index) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<nlohmann::json> out;
  size_t start = from_index < first_index_ ? 0 : from_index - first_index_;
  for (size_t i = start; i < events_.size(); i++) out.push_back(events_[i]);
  return out;
}

std::optional<std::chrono::steady_clock::time_point> EventStream::CompletedAt() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!completed_) return std::nullopt;
  return completed_at_;
}

StreamReader EventStream::Subscribe(size_t from_index) { return StreamReader(shared_from_this(), from_index); }

ReadStatus EventStream::WaitNext(size_t* cursor,
                                 nlohmann::json* out,
                                 std::chrono::milliseconds timeout,
                                 size_t* lost) {
  std::unique_lock<std::mutex> lock(mu_);
  auto has_next = [&]() { return *cursor < first_index_ + events_.size(); };
  if (!has_next() && !completed_) {
    cv_.wait_for(lock, timeout, [&]() { return has_next() || completed_; });
  }
  if (*cursor < first_index_) {
    *lost += first_index_ - *cursor;
    *cursor = first_index_;
  }
  if (has_next()) {
    *out = events_[*cursor - first_index_];
    (*cursor)++;
    return ReadStatus::kEvent;
  }
  return completed_ ? ReadStatus::kEnd : ReadStatus::kTimeout;
}

StreamReader::StreamReader(std::shared_ptr<EventStream> stream, size_t from_index)
    : stream_(std::move(stream)), cursor_(from_index) {}

ReadStatus StreamReader::Next(nlohmann::json* out, std::chrono::milliseconds timeout) {
  return stream_->WaitNext(&cursor_, out, timeout, &lost_);
}

StreamRegistry::StreamRegistry(StreamRegistryOptions options) : options_(options) {}

std::shared_ptr<EventStream> StreamRegistry::Create(const std::string& id, Error* err) {
  std::lock_guard<std::mutex> lock(mu_);
  SweepLocked(std::chrono::steady_clock::now());
  if (streams_.count(id)) {
    SetError(err, ErrorKind::kStreamAlreadyExists, "stream already exists: " + id);
    return nullptr;
  }
  auto stream = std::make_shared<EventStream>(id, options_.capacity);
  streams_[id] = Entry{stream, std::nullopt};
  return stream;
}

std::shared_ptr<EventStream> StreamRegistry::Get(const std::string& id, Error* err) {
  std::lock_guard<std::mutex> lock(mu_);
  SweepLocked(std::chrono::steady_clock::now());
  auto it = streams_.find(id);
  if (it == streams_.end()) {
    SetError(err, ErrorKind::kStreamNotFound, "stream not found: " + id);
    return nullptr;
  }
  return it->second.stream;
}

std::shared_ptr<EventStream> StreamRegistry::GetOrCreate(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  SweepLocked(std::chrono::steady_clock::now());
  auto it = streams_.find(id);
  if (it != streams_.end()) return it->second.stream;
  auto stream = std::make_shared<EventStream>(id, options_.capacity);
  streams_[id] = Entry{stream, std::nullopt};
  return stream;
}

std::optional<StreamReader> StreamRegistry::Subscribe(const std::string& id, size_t from_index, Error* err) {
  auto stream = Get(id, err);
  if (!stream) return std::nullopt;
  return stream->Subscribe(from_index);
}

bool StreamRegistry::Has(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  SweepLocked(std::chrono::steady_clock::now());
  return streams_.count(id) > 0;
}

bool StreamRegistry::Delete(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  return streams_.erase(id) > 0;
}

void StreamRegistry::MarkTerminalRead(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = streams_.find(id);
  if (it == streams_.end() || !it->second.stream->IsCompleted()) return;
  if (options_.grace.count() <= 0) {
    std::cout << "[stream] id=" << id << " released events=" << it->second.stream->Size() << "\n";
    streams_.erase(it);
    return;
  }
  if (!it->second.terminal_read_at) it->second.terminal_read_at = std::chrono::steady_clock::now();
}

size_t StreamRegistry::Sweep() {
  std::lock_guard<std::mutex> lock(mu_);
  return SweepLocked(std::chrono::steady_clock::now());
}

size_t StreamRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return streams_.size();
}

size_t StreamRegistry::SweepLocked(std::chrono::steady_clock::time_point now) {
  size_t removed = 0;
  for (auto it = streams_.begin(); it != streams_.end();) {
    bool expired = false;
    if (it->second.terminal_read_at) {
      expired = now - *it->second.terminal_read_at >= options_.grace;
    } else if (auto done = it->second.stream->CompletedAt()) {
      expired = now - *done >= options_.abandoned;
    }
    if (expired) {
      std::cout << "[stream] id=" << it->first << " released events=" << it->second.stream->Size() << "\n";
      it = streams_.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  return removed;
}

}  // namespace floword
