#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace debugpod::ports {

/*
  Reports which TCP ports the host already uses.

  Abstract so that tests can simulate a busy range.
*/
class PortProbe {
 public:
  virtual ~PortProbe() = default;

  // Snapshot of local ports held by any TCP socket, in any state.
  virtual std::set<std::uint16_t> PortsInUse() = 0;
};

/*
  Parses /proc/net/tcp and /proc/net/tcp6.

  When neither table is readable it falls back to a bind() test per port
  of the configured range.
*/
class ProcNetPortProbe final : public PortProbe {
 public:
  ProcNetPortProbe(std::uint16_t range_start, std::uint16_t range_end);
  explicit ProcNetPortProbe(std::vector<std::string> tables, std::uint16_t range_start = 0, std::uint16_t range_end = 0);

  std::set<std::uint16_t> PortsInUse() override;

  // Parses one /proc/net/tcp* table; exposed for tests.
  static void ParseTable(const std::string& contents, std::set<std::uint16_t>* out);

 private:
  static bool BindFails(std::uint16_t port);

  std::vector<std::string> tables_;
  std::uint16_t            range_start_;
  std::uint16_t            range_end_;
};

} // namespace debugpod::ports
