#include "port_probe.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fstream>
#include <sstream>

namespace debugpod::ports {

ProcNetPortProbe::ProcNetPortProbe(std::uint16_t range_start, std::uint16_t range_end)
    : ProcNetPortProbe(std::vector<std::string>{"/proc/net/tcp", "/proc/net/tcp6"}, range_start, range_end) {
}

ProcNetPortProbe::ProcNetPortProbe(std::vector<std::string> tables, std::uint16_t range_start, std::uint16_t range_end)
    : tables_(std::move(tables)), range_start_(range_start), range_end_(range_end) {
}

void ProcNetPortProbe::ParseTable(const std::string& contents, std::set<std::uint16_t>* out) {
  std::istringstream in(contents);
  std::string        line;

  // header: sl local_address rem_address st ...
  std::getline(in, line);

  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string        slot;
    std::string        local_address;
    if (!(fields >> slot >> local_address)) {
      continue;
    }

    const auto colon = local_address.rfind(':');
    if (colon == std::string::npos || colon + 1 >= local_address.size()) {
      continue;
    }

    try {
      const auto port = std::stoul(local_address.substr(colon + 1), nullptr, 16);
      if (port > 0 && port <= 0xFFFF) {
        out->insert(static_cast<std::uint16_t>(port));
      }
    } catch (const std::exception&) {
      continue;
    }
  }
}

bool ProcNetPortProbe::BindFails(std::uint16_t port) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return true;
  }

  sockaddr_in addr{};
  addr.sin_family      = AF_INET;
  addr.sin_port        = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  const bool failed = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0;
  ::close(fd);
  return failed;
}

std::set<std::uint16_t> ProcNetPortProbe::PortsInUse() {
  std::set<std::uint16_t> used;
  bool                    read_any = false;

  for (const auto& table : tables_) {
    std::ifstream in(table);
    if (!in) {
      continue;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    ParseTable(buffer.str(), &used);
    read_any = true;
  }

  if (!read_any) {
    for (std::uint32_t port = range_start_; port != 0 && port <= range_end_; ++port) {
      if (BindFails(static_cast<std::uint16_t>(port))) {
        used.insert(static_cast<std::uint16_t>(port));
      }
    }
  }

  return used;
}

} // namespace debugpod::ports
