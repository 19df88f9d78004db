#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace debugpod::proxy {

/*
  Sliding-window counter per key. A limit of 0 disables limiting.
*/
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(std::uint32_t limit, std::chrono::milliseconds window);

  bool TryAcquire(const std::string& key);
  bool TryAcquire(const std::string& key, Clock::time_point now);

  void Forget(const std::string& key);

 private:
  const std::uint32_t             limit_;
  const std::chrono::milliseconds window_;

  std::mutex                                                    mutex_;
  std::unordered_map<std::string, std::deque<Clock::time_point>> hits_;
};

} // namespace debugpod::proxy
