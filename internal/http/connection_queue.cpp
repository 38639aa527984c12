#include "connection_queue.hpp"

namespace shakemap::http {

ConnectionQueue::ConnectionQueue(std::size_t capacity) : capacity_(capacity) {
}

bool ConnectionQueue::Push(int fd) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push(fd);
  }
  cv_.notify_one();
  return true;
}

std::optional<int> ConnectionQueue::Pop() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  int fd = queue_.front();
  queue_.pop();
  return fd;
}

void ConnectionQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace shakemap::http
