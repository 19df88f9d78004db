#include "api_contract.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <set>

#include "internal/util/errors.hpp"

namespace debugpod::proxy {

namespace {

// Keys of an OpenAPI path item that are operations.
const std::set<std::string> kOperationKeys = {"get", "put", "post", "delete", "options", "head", "patch", "trace"};

std::string ToUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool IsParameter(const std::string& segment) {
  return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

ApiContract::ApiContract(std::vector<ContractEntry> entries) : entries_(std::move(entries)) {
  for (auto& entry : entries_) {
    entry.method = ToUpper(entry.method);
    if (entry.segments.empty()) {
      entry.segments = SplitSegments(entry.path_template);
    }
  }
}

ApiContract ApiContract::ParseOpenApi(const std::string& document) {
  google::protobuf::Struct                 root;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(document, &root, options);
  if (!status.ok()) {
    throw debugpod::util::ContractUnavailable("API description is not valid JSON: " + status.ToString());
  }

  const auto paths = root.fields().find("paths");
  if (paths == root.fields().end() || paths->second.kind_case() != google::protobuf::Value::kStructValue) {
    throw debugpod::util::ContractUnavailable("API description has no paths object");
  }

  std::vector<ContractEntry> entries;
  for (const auto& [path, item] : paths->second.struct_value().fields()) {
    if (item.kind_case() != google::protobuf::Value::kStructValue) {
      continue;
    }
    for (const auto& [key, _] : item.struct_value().fields()) {
      if (!kOperationKeys.contains(ToLower(key))) {
        continue;  // parameters, summary, servers, ...
      }
      ContractEntry entry;
      entry.method        = ToUpper(key);
      entry.path_template = path;
      entry.segments      = SplitSegments(path);
      entries.push_back(std::move(entry));
    }
  }

  // map iteration order is unspecified; keep the contract stable
  std::sort(entries.begin(), entries.end(), [](const ContractEntry& a, const ContractEntry& b) {
    return a.path_template == b.path_template ? a.method < b.method : a.path_template < b.path_template;
  });

  return ApiContract(std::move(entries));
}

bool ApiContract::Allows(std::string_view method, std::string_view path) const {
  const auto segments = SplitSegments(NormalizePath(path));

  // The agent may resolve dot segments after matching, reaching a path
  // outside the declared one.
  for (const auto& segment : segments) {
    if (segment == "." || segment == "..") {
      return false;
    }
  }

  for (const auto& entry : entries_) {
    if (entry.method != method || entry.segments.size() != segments.size()) {
      continue;
    }

    bool match = true;
    for (std::size_t i = 0; i < segments.size() && match; ++i) {
      match = IsParameter(entry.segments[i]) || entry.segments[i] == segments[i];
    }
    if (match) {
      return true;
    }
  }
  return false;
}

std::string ApiContract::NormalizePath(std::string_view raw_path) {
  const auto query = raw_path.find('?');
  if (query != std::string_view::npos) {
    raw_path = raw_path.substr(0, query);
  }
  auto decoded = PercentDecode(raw_path);
  if (decoded.empty() || decoded.front() != '/') {
    decoded.insert(decoded.begin(), '/');
  }
  return decoded;
}

std::vector<std::string> ApiContract::SplitSegments(std::string_view path) {
  std::vector<std::string> segments;

  std::size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    if (end > start) {
      segments.emplace_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return segments;
}

std::string ApiContract::PercentDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());

  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      const int hi = HexValue(value[i + 1]);
      const int lo = HexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

} // namespace debugpod::proxy
