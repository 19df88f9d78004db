#include "errors.hpp"

namespace debugpod::util {

const char* ErrorKind(const std::exception& e) {
  if (dynamic_cast<const InvalidRequest*>(&e)) {
    return "InvalidRequest";
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return "AlreadyExists";
  }
  if (dynamic_cast<const InstanceNotFound*>(&e)) {
    return "InstanceNotFound";
  }
  if (dynamic_cast<const CommitNotFound*>(&e)) {
    return "CommitNotFound";
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return "ResourceExhausted";
  }
  if (dynamic_cast<const StartupTimeout*>(&e)) {
    return "StartupTimeout";
  }
  if (dynamic_cast<const ContractUnavailable*>(&e)) {
    return "ContractUnavailable";
  }
  if (dynamic_cast<const RequestRejected*>(&e)) {
    return "RequestRejected";
  }
  if (dynamic_cast<const UpstreamUnavailable*>(&e)) {
    return "UpstreamUnavailable";
  }
  if (dynamic_cast<const RateLimited*>(&e)) {
    return "RateLimited";
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return "InvalidState";
  }
  return "Internal";
}

} // namespace debugpod::util
