#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace debugpod::proxy {

struct ContractEntry {
  std::string              method;  // upper case
  std::string              path_template;
  std::vector<std::string> segments;
};

/*
  Immutable set of (method, path template) pairs an agent accepts.

  Built once from the agent's OpenAPI document and then only read, so it is
  shared between threads without locking.
*/
class ApiContract {
 public:
  ApiContract() = default;
  explicit ApiContract(std::vector<ContractEntry> entries);

  // Throws util::ContractUnavailable when the document is not usable.
  static ApiContract ParseOpenApi(const std::string& document);

  // `path` is the raw request path; the query is stripped and it is
  // percent-decoded before matching. Empty segments collapse; "." and ".."
  // segments never match.
  bool Allows(std::string_view method, std::string_view path) const;

  const std::vector<ContractEntry>& Entries() const {
    return entries_;
  }

  std::size_t Size() const {
    return entries_.size();
  }

  static std::string              NormalizePath(std::string_view raw_path);
  static std::vector<std::string> SplitSegments(std::string_view path);
  static std::string              PercentDecode(std::string_view value);

 private:
  std::vector<ContractEntry> entries_;
};

} // namespace debugpod::proxy
