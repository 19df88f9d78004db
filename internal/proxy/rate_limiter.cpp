#include "rate_limiter.hpp"

namespace debugpod::proxy {

RateLimiter::RateLimiter(std::uint32_t limit, std::chrono::milliseconds window) : limit_(limit), window_(window) {
}

bool RateLimiter::TryAcquire(const std::string& key) {
  return TryAcquire(key, Clock::now());
}

bool RateLimiter::TryAcquire(const std::string& key, Clock::time_point now) {
  if (limit_ == 0) {
    return true;
  }

  std::lock_guard lock(mutex_);
  auto&           hits = hits_[key];
  while (!hits.empty() && now - hits.front() >= window_) {
    hits.pop_front();
  }
  if (hits.size() >= limit_) {
    return false;
  }
  hits.push_back(now);
  return true;
}

void RateLimiter::Forget(const std::string& key) {
  std::lock_guard lock(mutex_);
  hits_.erase(key);
}

} // namespace debugpod::proxy
