#pragma once

#include <cstdint>
#include <string>

namespace circulation::db::model {

struct AuditRecord {
  std::string event_id;
  std::string entity_type; // "loan" | "copy"
  std::string entity_id;
  std::string from_state;
  std::string to_state;
  std::string actor;
  std::string correlation_id;
  uint64_t    recorded_at_ms = 0;
};

}
