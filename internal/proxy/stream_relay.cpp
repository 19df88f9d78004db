#include "stream_relay.hpp"

#include "internal/util/errors.hpp"

namespace debugpod::proxy {

StreamRelay::StreamRelay(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

void StreamRelay::OnHead(int status, const HeaderList& headers) {
  {
    std::lock_guard lock(mutex_);
    head_ = ResponseHead{status, headers};
  }
  cv_.notify_all();
}

bool StreamRelay::OnChunk(std::string_view data) {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return cancelled_ || chunks_.size() < capacity_; });
  if (cancelled_) return false;

  chunks_.emplace_back(data);
  lock.unlock();
  cv_.notify_all();
  return true;
}

void StreamRelay::OnComplete() {
  {
    std::lock_guard lock(mutex_);
    done_ = true;
  }
  cv_.notify_all();
}

void StreamRelay::OnError(const std::string& message) {
  {
    std::lock_guard lock(mutex_);
    error_message_ = message;
    done_          = true;
  }
  cv_.notify_all();
}

void StreamRelay::Fail(std::exception_ptr error) {
  {
    std::lock_guard lock(mutex_);
    error_ = std::move(error);
    done_  = true;
  }
  cv_.notify_all();
}

ResponseHead StreamRelay::WaitHead() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return head_.has_value() || done_ || cancelled_; });

  if (head_) return *head_;
  if (error_) std::rethrow_exception(error_);
  if (cancelled_) throw debugpod::util::UpstreamUnavailable("relay cancelled");
  throw debugpod::util::UpstreamUnavailable(error_message_.empty() ? "upstream closed without a response" : error_message_);
}

std::optional<std::string> StreamRelay::Next() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return cancelled_ || done_ || !chunks_.empty(); });

  if (chunks_.empty() || cancelled_) return std::nullopt;

  std::string chunk = std::move(chunks_.front());
  chunks_.pop_front();
  lock.unlock();
  cv_.notify_all();
  return chunk;
}

bool StreamRelay::Failed() const {
  std::lock_guard lock(mutex_);
  return error_ != nullptr || !error_message_.empty();
}

void StreamRelay::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
    chunks_.clear();
  }
  cv_.notify_all();
}

} // namespace debugpod::proxy
