#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace debugpod::reaper {

class OrphanReaper;

/*
  Background thread running the reaper every interval.

  Stop() wakes the thread immediately and joins it.
*/
class ReaperWorker {
 public:
  ReaperWorker(std::shared_ptr<OrphanReaper> reaper, std::chrono::seconds interval);
  ~ReaperWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<OrphanReaper> reaper_;
  std::chrono::seconds          interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace debugpod::reaper
