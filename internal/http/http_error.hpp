#pragma once

#include <exception>
#include <string>

namespace debugpod::http {

/*
  Converts internal exceptions into HTTP status codes and the
  {"error": {"kind", "message"}} body.
*/

int         HttpStatusFor(const std::exception& e);
std::string ErrorBody(const std::exception& e);

} // namespace debugpod::http
