#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cbridge {

// Push queue for one session.  Producers are request handlers, the consumer
// is whichever SSE stream is attached.
class channel {
 public:
  enum class pop_status { message, timeout, closed };

  explicit channel(std::size_t capacity = 1000) : capacity_{capacity} {}

  // Oldest messages are dropped once the queue is at capacity.
  void push(std::string msg);
  pop_status wait_pop(std::string& out, std::chrono::milliseconds timeout);
  void close();
  bool closed() const;
  std::size_t pending() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  std::size_t capacity_;
  bool closed_{false};
};

class session_hub {
 public:
  // The channel for id, created on first use.
  std::shared_ptr<channel> open(const std::string& id);
  // Queue a serialized message on id's channel, if it has one.
  bool publish(const std::string& id, std::string msg);
  // Close and forget id's channel.  False if there was none.
  bool close(const std::string& id);
  // Close ch and forget it, unless id has since been given another channel.
  void release(const std::string& id, const std::shared_ptr<channel>& ch);
  bool contains(const std::string& id) const;
  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<channel>> channels_;
};

// 32 lowercase hex digits.
std::string make_session_id();

}  // namespace cbridge
