#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "circulation/v1.hpp"
#include "circulation/v1/admin_service.grpc.pb.h"
#include "circulation/v1/circulation_service.grpc.pb.h"
#include "internal/util/uuid.hpp"

using namespace circulation::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  circulationctl <addr> [--user <id>] [--role member|admin] [--key <idempotency_key>] <command> ...\n"
            << "\n"
            << "Commands:\n"
            << "  checkout <copy_id> <user_id>\n"
            << "  return <copy_id> <user_id>\n"
            << "  renew <loan_id>\n"
            << "  report-lost <copy_id>\n"
            << "  active <copy_id>\n"
            << "  loans <user_id>\n"
            << "  register <copy_id> <book_id>\n"
            << "  retire <copy_id>\n"
            << "  copy <copy_id>\n"
            << "  history <loan_id>\n"
            << "  audit <loan|copy> <entity_id>\n"
            << "  stats\n"
            << "\n"
            << "Write commands without --key use a fresh key; repeat --key to retry safely.\n";
}

static const char* CopyStatusName(CopyStatus status) {
  switch (status) {
    case COPY_STATUS_AVAILABLE:
      return "available";
    case COPY_STATUS_LOANED:
      return "loaned";
    case COPY_STATUS_LOST:
      return "lost";
    case COPY_STATUS_RETIRED:
      return "retired";
    default:
      return "unspecified";
  }
}

static const char* LoanStatusName(LoanStatus status) {
  switch (status) {
    case LOAN_STATUS_ACTIVE:
      return "active";
    case LOAN_STATUS_RETURNED:
      return "returned";
    case LOAN_STATUS_LOST:
      return "lost";
    default:
      return "unspecified";
  }
}

static void PrintCopy(const Copy& copy) {
  std::cout << "copy=" << copy.copy_id() << " book=" << copy.book_id() << " status=" << CopyStatusName(copy.status());
  if (!copy.current_loan_id().empty()) {
    std::cout << " loan=" << copy.current_loan_id();
  }
  std::cout << "\n";
}

static void PrintLoan(const Loan& loan) {
  std::cout << "loan=" << loan.loan_id() << " copy=" << loan.copy_id() << " user=" << loan.user_id()
            << " status=" << LoanStatusName(loan.status()) << " due_at=" << loan.due_at().seconds()
            << " renewals=" << loan.renewal_count() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string              addr = argv[1];
  std::string              user;
  std::string              role;
  std::string              key;
  std::vector<std::string> args;

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--user" || arg == "--role" || arg == "--key") && i + 1 < argc) {
      std::string& target = arg == "--user" ? user : (arg == "--role" ? role : key);
      target              = argv[++i];
      continue;
    }
    args.push_back(arg);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }
  const std::string cmd = args[0];
  if (key.empty()) {
    key = circulation::util::NewId();
  }

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto circulation_stub = CirculationService::NewStub(channel);
  auto admin_stub       = CirculationAdminService::NewStub(channel);

  grpc::ClientContext ctx;
  if (!user.empty()) {
    ctx.AddMetadata("x-user-id", user);
  }
  if (!role.empty()) {
    ctx.AddMetadata("x-user-role", role);
  }

  // ------------------------------------------------------------

  if (cmd == "checkout") {
    if (args.size() < 3) return 1;

    CheckoutRequest req;
    req.set_copy_id(args[1]);
    req.set_user_id(args[2]);
    req.set_idempotency_key(key);

    CheckoutResponse resp;

    auto status = circulation_stub->Checkout(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    PrintLoan(resp.loan());
    std::cout << "replayed=" << (resp.replayed() ? "true" : "false") << " key=" << key << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "return") {
    if (args.size() < 3) return 1;

    ReturnCopyRequest req;
    req.set_copy_id(args[1]);
    req.set_user_id(args[2]);
    req.set_idempotency_key(key);

    ReturnCopyResponse resp;

    auto status = circulation_stub->ReturnCopy(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    PrintLoan(resp.receipt().loan());
    PrintCopy(resp.receipt().copy());
    std::cout << "replayed=" << (resp.replayed() ? "true" : "false") << " key=" << key << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "renew") {
    if (args.size() < 2) return 1;

    RenewRequest req;
    req.set_loan_id(args[1]);
    req.set_idempotency_key(key);

    RenewResponse resp;

    auto status = circulation_stub->Renew(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "loan=" << resp.renewal().loan_id() << " due_at=" << resp.renewal().new_due_at().seconds()
              << " renewals=" << resp.renewal().renewal_count() << "\n";
    std::cout << "replayed=" << (resp.replayed() ? "true" : "false") << " key=" << key << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "report-lost") {
    if (args.size() < 2) return 1;

    ReportLostRequest req;
    req.set_copy_id(args[1]);
    req.set_idempotency_key(key);

    ReportLostResponse resp;

    auto status = circulation_stub->ReportLost(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    PrintLoan(resp.report().loan());
    PrintCopy(resp.report().copy());
    std::cout << "replayed=" << (resp.replayed() ? "true" : "false") << " key=" << key << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "active") {
    if (args.size() < 2) return 1;

    GetActiveLoanRequest req;
    req.set_copy_id(args[1]);

    GetActiveLoanResponse resp;

    auto status = circulation_stub->GetActiveLoan(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    PrintLoan(resp.loan());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "loans") {
    if (args.size() < 2) return 1;

    ListLoansRequest req;
    req.set_user_id(args[1]);

    ListLoansResponse resp;

    auto status = circulation_stub->ListLoans(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    for (const auto& loan : resp.loans()) {
      PrintLoan(loan);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "register") {
    if (args.size() < 3) return 1;

    RegisterCopyRequest req;
    req.set_copy_id(args[1]);
    req.set_book_id(args[2]);

    RegisterCopyResponse resp;

    auto status = admin_stub->RegisterCopy(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    PrintCopy(resp.copy());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retire") {
    if (args.size() < 2) return 1;

    RetireCopyRequest req;
    req.set_copy_id(args[1]);

    RetireCopyResponse resp;

    auto status = admin_stub->RetireCopy(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    PrintCopy(resp.copy());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "copy") {
    if (args.size() < 2) return 1;

    GetCopyRequest req;
    req.set_copy_id(args[1]);

    GetCopyResponse resp;

    auto status = admin_stub->GetCopy(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    PrintCopy(resp.copy());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (args.size() < 2) return 1;

    GetLoanHistoryRequest req;
    req.set_loan_id(args[1]);

    GetLoanHistoryResponse resp;

    auto status = admin_stub->GetLoanHistory(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    for (const auto& event : resp.events()) {
      std::cout << "#" << event.sequence() << " " << event.kind() << " correlation=" << event.correlation_id() << " ";
      PrintLoan(event.loan());
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "audit") {
    if (args.size() < 3) return 1;

    ListAuditEventsRequest req;
    req.set_entity_type(args[1]);
    req.set_entity_id(args[2]);

    ListAuditEventsResponse resp;

    auto status = admin_stub->ListAuditEvents(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    for (const auto& event : resp.events()) {
      std::cout << event.event_id() << " " << event.from_state() << " -> " << event.to_state() << " actor=" << event.actor()
                << " correlation=" << event.correlation_id() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "available=" << resp.copies_available() << "\n";
    std::cout << "loaned=" << resp.copies_loaned() << "\n";
    std::cout << "lost=" << resp.copies_lost() << "\n";
    std::cout << "retired=" << resp.copies_retired() << "\n";
    std::cout << "pending_audit_events=" << resp.pending_audit_events() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
