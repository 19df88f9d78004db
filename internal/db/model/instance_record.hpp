#pragma once

#include <cstdint>
#include <string>

namespace debugpod::db::model {

/*
  Persistent instance row.

  status holds debugpod::model::InstanceStatus as an integer so the journal
  stays independent of the in-memory model.
*/

struct InstanceRecord {
  std::string correlation_id;
  uint64_t    generation = 0;

  std::string source_commit;
  std::string reference_commit;
  std::string compare_advice;
  bool        matches_reference = false;

  std::string working_copy_path;
  std::string branch_name;
  std::string log_path;

  uint32_t port       = 0;
  int64_t  process_id = 0;
  int      status     = 0;

  uint64_t created_at_ms = 0;
};

} // namespace debugpod::db::model
