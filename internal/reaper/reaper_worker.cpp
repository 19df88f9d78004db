#include "reaper_worker.hpp"

#include "internal/observability/logging.hpp"
#include "orphan_reaper.hpp"

namespace debugpod::reaper {

ReaperWorker::ReaperWorker(std::shared_ptr<OrphanReaper> reaper, std::chrono::seconds interval)
    : reaper_(std::move(reaper)), interval_(interval) {
}

ReaperWorker::~ReaperWorker() {
  Stop();
}

void ReaperWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ReaperWorker::Run, this);
}

void ReaperWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ReaperWorker::Run() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, interval_, [&] { return !running_; });
      if (!running_) break;
    }

    try {
      reaper_->RunOnce();
    } catch (const std::exception& e) {
      DEBUGPOD_LOG_ERROR("Reaper pass failed", {debugpod::observability::StringField("error", e.what())});
    }
  }
}

} // namespace debugpod::reaper
