#include "cbridge/session_hub.hpp"

#include <fmt/format.h>

#include <random>

#include "logger.hpp"

namespace cbridge {

/// channel

void channel::push(std::string msg) {
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (closed_) return;
    if (queue_.size() >= capacity_) queue_.pop_front();
    queue_.push_back(std::move(msg));
  }
  cv_.notify_one();
}

channel::pop_status channel::wait_pop(
    std::string& out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock{mutex_};
  if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); }))
    return pop_status::timeout;
  if (closed_) return pop_status::closed;
  out = std::move(queue_.front());
  queue_.pop_front();
  return pop_status::message;
}

void channel::close() {
  {
    std::lock_guard<std::mutex> lock{mutex_};
    closed_ = true;
    queue_.clear();
  }
  cv_.notify_all();
}

bool channel::closed() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return closed_;
}

std::size_t channel::pending() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return queue_.size();
}

/// session_hub

std::shared_ptr<channel> session_hub::open(const std::string& id) {
  std::lock_guard<std::mutex> lock{mutex_};
  auto& ch = channels_[id];
  if (!ch) {
    LOG_DEBUG("session {} opened", id);
    ch = std::make_shared<channel>();
  }
  return ch;
}

bool session_hub::publish(const std::string& id, std::string msg) {
  std::shared_ptr<channel> ch;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    auto it = channels_.find(id);
    if (it == channels_.end()) return false;
    ch = it->second;
  }
  ch->push(std::move(msg));
  return true;
}

bool session_hub::close(const std::string& id) {
  std::shared_ptr<channel> ch;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    auto it = channels_.find(id);
    if (it == channels_.end()) return false;
    ch = std::move(it->second);
    channels_.erase(it);
  }
  ch->close();
  LOG_DEBUG("session {} closed", id);
  return true;
}

void session_hub::release(
    const std::string& id, const std::shared_ptr<channel>& ch) {
  {
    std::lock_guard<std::mutex> lock{mutex_};
    auto it = channels_.find(id);
    if (it != channels_.end() && it->second == ch) channels_.erase(it);
  }
  ch->close();
  LOG_DEBUG("session {} released", id);
}

bool session_hub::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock{mutex_};
  return channels_.contains(id);
}

std::size_t session_hub::size() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return channels_.size();
}

std::string make_session_id() {
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  thread_local std::mt19937_64 gen{std::random_device{}()};
  return fmt::format("{:016x}{:016x}", gen(), gen());
}

}  // namespace cbridge
