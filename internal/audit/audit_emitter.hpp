#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/transition.hpp"

namespace circulation::audit {

/*
  Appends one immutable audit event per entity changed by a committed
  transition, each in its own store transaction.

  Event ids are "<transition_id>:<entity_type>", so emitting the same
  transition twice stores it once.

  A failed append never undoes the transition: after the configured number
  of attempts the event is logged as an audit gap and kept in an in-memory
  backlog that DrainBacklog retries.
*/
class AuditEmitter {
 public:
  AuditEmitter(std::shared_ptr<db::Repository> repository, uint32_t attempts);

  static std::string EventId(const std::string& transition_id, const std::string& entity_type);

  static std::vector<db::model::AuditRecord> EventsFor(const model::Transition& transition, const std::string& actor,
                                                       const std::string& correlation_id, uint64_t recorded_at_ms);

  // Returns false when the event was queued instead of stored.
  bool Record(const db::model::AuditRecord& record);

  // Returns the number of events that had to be queued.
  std::size_t RecordTransition(const model::Transition& transition, const std::string& actor, const std::string& correlation_id);

  // Retries queued events once each; returns how many are still queued.
  std::size_t DrainBacklog();

  std::size_t PendingGaps() const;

 private:
  // One append in its own transaction. AlreadyExists counts as stored.
  bool TryAppend(const db::model::AuditRecord& record);

  std::shared_ptr<db::Repository> repository_;
  uint32_t                        attempts_;

  mutable std::mutex                   backlog_mutex_;
  std::deque<db::model::AuditRecord>   backlog_;
};

} // namespace circulation::audit
