#include "internal/model/proto_convert.hpp"

#include "internal/util/time.hpp"

namespace circulation::model {

circulation::v1::Copy ToProto(const db::model::CopyRecord& record) {
  circulation::v1::Copy copy;
  copy.set_copy_id(record.copy_id);
  copy.set_book_id(record.book_id);
  copy.set_status(record.status);
  copy.set_current_loan_id(record.current_loan_id);
  return copy;
}

circulation::v1::Loan ToProto(const db::model::LoanRecord& record) {
  circulation::v1::Loan loan;
  loan.set_loan_id(record.loan_id);
  loan.set_copy_id(record.copy_id);
  loan.set_user_id(record.user_id);
  loan.set_status(record.status);
  *loan.mutable_checked_out_at() = util::MillisToProto(record.checked_out_at_ms);
  *loan.mutable_due_at()         = util::MillisToProto(record.due_at_ms);
  if (record.returned_at_ms != 0) {
    *loan.mutable_returned_at() = util::MillisToProto(record.returned_at_ms);
  }
  loan.set_renewal_count(record.renewal_count);
  return loan;
}

circulation::v1::LoanEvent ToProto(const db::model::LoanEventRecord& record) {
  circulation::v1::LoanEvent event;
  event.set_sequence(record.sequence);
  event.set_kind(record.kind);
  *event.mutable_loan() = ToProto(record.loan);
  event.set_correlation_id(record.correlation_id);
  *event.mutable_recorded_at() = util::MillisToProto(record.recorded_at_ms);
  event.set_transition_id(record.transition_id);
  return event;
}

circulation::v1::AuditEvent ToProto(const db::model::AuditRecord& record) {
  circulation::v1::AuditEvent event;
  event.set_event_id(record.event_id);
  event.set_entity_type(record.entity_type);
  event.set_entity_id(record.entity_id);
  event.set_from_state(record.from_state);
  event.set_to_state(record.to_state);
  event.set_actor(record.actor);
  event.set_correlation_id(record.correlation_id);
  *event.mutable_timestamp() = util::MillisToProto(record.recorded_at_ms);
  return event;
}

} // namespace circulation::model
