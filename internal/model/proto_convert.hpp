#pragma once

#include "circulation/v1.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/copy_record.hpp"
#include "internal/db/model/loan_event_record.hpp"
#include "internal/db/model/loan_record.hpp"

namespace circulation::model {

circulation::v1::Copy       ToProto(const db::model::CopyRecord& record);
circulation::v1::Loan       ToProto(const db::model::LoanRecord& record);
circulation::v1::LoanEvent  ToProto(const db::model::LoanEventRecord& record);
circulation::v1::AuditEvent ToProto(const db::model::AuditRecord& record);

} // namespace circulation::model
