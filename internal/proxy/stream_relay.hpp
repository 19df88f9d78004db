#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <string>

#include "upstream.hpp"

namespace debugpod::proxy {

struct ResponseHead {
  int        status = 0;
  HeaderList headers;
};

/*
  Bounded hand-off between the thread reading from an agent and the thread
  writing to the client.

  The producer blocks once `capacity` chunks are queued. Cancel() releases
  both sides; the producer then sees OnChunk return false.
*/
class StreamRelay final : public ResponseSink {
 public:
  explicit StreamRelay(std::size_t capacity);

  // Producer side.
  void OnHead(int status, const HeaderList& headers) override;
  bool OnChunk(std::string_view data) override;
  void OnComplete() override;
  void OnError(const std::string& message) override;

  // Failure before any head; rethrown by WaitHead.
  void Fail(std::exception_ptr error);

  // Consumer side.
  ResponseHead WaitHead();

  // Blocks for the next chunk; nullopt at end of stream.
  std::optional<std::string> Next();

  bool Failed() const;

  void Cancel();

 private:
  const std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  std::optional<ResponseHead> head_;
  std::deque<std::string>     chunks_;
  std::exception_ptr          error_;
  std::string                 error_message_;
  bool                        done_      = false;
  bool                        cancelled_ = false;
};

} // namespace debugpod::proxy
