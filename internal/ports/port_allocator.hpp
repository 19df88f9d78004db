#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>

#include "port_probe.hpp"

namespace debugpod::ports {

/*
  Hands out TCP ports from a fixed inclusive range.

  A port is free when the host does not use it and no live instance holds a
  reservation on it. The probe and the reservation happen under one mutex, so
  two concurrent Allocate() calls never return the same port.
*/
class PortAllocator {
 public:
  PortAllocator(std::uint16_t range_start, std::uint16_t range_end, std::shared_ptr<PortProbe> probe);

  // Throws util::ResourceExhausted when the whole range is taken.
  std::uint16_t Allocate();

  // Marks a known port as reserved (re-adoption after restart).
  void Reserve(std::uint16_t port);

  // Idempotent.
  void Release(std::uint16_t port);

  bool        IsReserved(std::uint16_t port) const;
  bool        InRange(std::uint16_t port) const;
  std::size_t ReservedCount() const;

  std::uint16_t RangeStart() const {
    return range_start_;
  }
  std::uint16_t RangeEnd() const {
    return range_end_;
  }

 private:
  const std::uint16_t        range_start_;
  const std::uint16_t        range_end_;
  std::shared_ptr<PortProbe> probe_;

  mutable std::mutex      mutex_;
  std::set<std::uint16_t> reserved_;
};

} // namespace debugpod::ports
