#include "port_allocator.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace debugpod::ports {

PortAllocator::PortAllocator(std::uint16_t range_start, std::uint16_t range_end, std::shared_ptr<PortProbe> probe)
    : range_start_(range_start), range_end_(range_end), probe_(std::move(probe)) {
  if (range_start_ == 0 || range_start_ > range_end_) {
    throw std::invalid_argument("port range must be ascending and non-zero");
  }
  if (!probe_) {
    throw std::invalid_argument("port allocator requires a probe");
  }
}

std::uint16_t PortAllocator::Allocate() {
  std::lock_guard lock(mutex_);

  const auto in_use = probe_->PortsInUse();

  for (std::uint32_t port = range_start_; port <= range_end_; ++port) {
    const auto candidate = static_cast<std::uint16_t>(port);
    if (reserved_.contains(candidate) || in_use.contains(candidate)) {
      continue;
    }
    reserved_.insert(candidate);
    DEBUGPOD_LOG_DEBUG("Port reserved", {debugpod::observability::IntField("port", candidate)});
    return candidate;
  }

  throw debugpod::util::ResourceExhausted("no free port in range " + std::to_string(range_start_) + "-" + std::to_string(range_end_));
}

void PortAllocator::Reserve(std::uint16_t port) {
  if (!InRange(port)) {
    throw debugpod::util::InvalidRequest("port " + std::to_string(port) + " is outside the configured range");
  }
  std::lock_guard lock(mutex_);
  reserved_.insert(port);
}

void PortAllocator::Release(std::uint16_t port) {
  std::lock_guard lock(mutex_);
  if (reserved_.erase(port) > 0) {
    DEBUGPOD_LOG_DEBUG("Port released", {debugpod::observability::IntField("port", port)});
  }
}

bool PortAllocator::IsReserved(std::uint16_t port) const {
  std::lock_guard lock(mutex_);
  return reserved_.contains(port);
}

bool PortAllocator::InRange(std::uint16_t port) const {
  return port >= range_start_ && port <= range_end_;
}

std::size_t PortAllocator::ReservedCount() const {
  std::lock_guard lock(mutex_);
  return reserved_.size();
}

} // namespace debugpod::ports
