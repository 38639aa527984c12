#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace shakemap::http {

/*
  Thread-safe blocking queue of accepted client sockets.

  Push() refuses new sockets once the backlog is full so the accept
  thread can shed load instead of buffering without bound.
*/
class ConnectionQueue {
 public:
  explicit ConnectionQueue(std::size_t capacity);

  bool Push(int fd);

  // blocking wait, nullopt after Shutdown() once drained
  std::optional<int> Pop();

  void Shutdown();

 private:
  std::size_t             capacity_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<int>         queue_;
  bool                    shutdown_ = false;
};

} // namespace shakemap::http
