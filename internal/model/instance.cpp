#include "internal/model/instance.hpp"

namespace debugpod::model {

std::string BranchNameFor(const std::string& correlation_id) {
  return "debug/" + correlation_id;
}

} // namespace debugpod::model
