#include "result.hpp"

#include <stdexcept>

namespace debugpod::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void Check(const Result& result, const std::string& operation) {
  if (result) {
    return;
  }
  std::string what = operation + ": " + ToString(result.code);
  if (!result.message.empty()) {
    what += ": " + result.message;
  }
  throw std::runtime_error(what);
}

} // namespace debugpod::db
