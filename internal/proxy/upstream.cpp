#include "upstream.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace debugpod::proxy {

namespace {

constexpr std::array<std::string_view, 8> kStrippedHeaders = {
    "host", "connection", "content-length", "transfer-encoding", "keep-alive", "upgrade", "forwarded", "te",
};

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

bool IsHopByHopHeader(std::string_view name) {
  const auto lower = Lower(name);
  if (lower.rfind("proxy-", 0) == 0 || lower.rfind("x-forwarded-", 0) == 0) {
    return true;
  }
  return std::find(kStrippedHeaders.begin(), kStrippedHeaders.end(), lower) != kStrippedHeaders.end();
}

HeaderList FilterHeaders(const HeaderList& headers) {
  HeaderList out;
  out.reserve(headers.size());
  for (const auto& header : headers) {
    if (!IsHopByHopHeader(header.first)) {
      out.push_back(header);
    }
  }
  return out;
}

} // namespace debugpod::proxy
