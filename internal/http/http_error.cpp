#include "http_error.hpp"

#include "debugpod/v1/instance.pb.h"
#include "internal/util/errors.hpp"
#include "json_codec.hpp"

namespace debugpod::http {

int HttpStatusFor(const std::exception& e) {
  using namespace debugpod::util;

  if (dynamic_cast<const InvalidRequest*>(&e)) return 400;
  if (dynamic_cast<const RequestRejected*>(&e)) return 403;
  if (dynamic_cast<const InstanceNotFound*>(&e)) return 404;
  if (dynamic_cast<const AlreadyExists*>(&e)) return 409;
  if (dynamic_cast<const InvalidState*>(&e)) return 409;
  if (dynamic_cast<const CommitNotFound*>(&e)) return 422;
  if (dynamic_cast<const RateLimited*>(&e)) return 429;
  if (dynamic_cast<const ContractUnavailable*>(&e)) return 502;
  if (dynamic_cast<const UpstreamUnavailable*>(&e)) return 502;
  if (dynamic_cast<const ResourceExhausted*>(&e)) return 503;
  if (dynamic_cast<const StartupTimeout*>(&e)) return 504;

  return 500;
}

std::string ErrorBody(const std::exception& e) {
  debugpod::v1::ErrorResponse body;
  body.mutable_error()->set_kind(debugpod::util::ErrorKind(e));
  body.mutable_error()->set_message(e.what());
  return ToJson(body);
}

} // namespace debugpod::http
