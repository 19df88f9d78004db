#pragma once

#include <stdexcept>
#include <string>

namespace debugpod::util {

/*
  Central error types.

  These get translated later to gRPC status codes and HTTP responses.
*/

class InvalidRequest : public std::runtime_error {
 public:
  explicit InvalidRequest(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InstanceNotFound : public std::runtime_error {
 public:
  explicit InstanceNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CommitNotFound : public std::runtime_error {
 public:
  explicit CommitNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StartupTimeout : public std::runtime_error {
 public:
  explicit StartupTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ContractUnavailable : public std::runtime_error {
 public:
  explicit ContractUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Proxy validation failure. Not a server error.
class RequestRejected : public std::runtime_error {
 public:
  explicit RequestRejected(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UpstreamUnavailable : public std::runtime_error {
 public:
  explicit UpstreamUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RateLimited : public std::runtime_error {
 public:
  explicit RateLimited(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Stable taxonomy names used in error payloads.
*/
const char* ErrorKind(const std::exception& e);

} // namespace debugpod::util
