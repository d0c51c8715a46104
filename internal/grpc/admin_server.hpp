#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "circulation/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace circulation::grpc {

class AdminServer final : public circulation::v1::CirculationAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<circulation::service::AdminService> svc);

  ::grpc::Status RegisterCopy(::grpc::ServerContext*,
                              const circulation::v1::RegisterCopyRequest*,
                              circulation::v1::RegisterCopyResponse*) override;

  ::grpc::Status RetireCopy(::grpc::ServerContext*,
                            const circulation::v1::RetireCopyRequest*,
                            circulation::v1::RetireCopyResponse*) override;

  ::grpc::Status GetCopy(::grpc::ServerContext*,
                         const circulation::v1::GetCopyRequest*,
                         circulation::v1::GetCopyResponse*) override;

  ::grpc::Status GetLoanHistory(::grpc::ServerContext*,
                                const circulation::v1::GetLoanHistoryRequest*,
                                circulation::v1::GetLoanHistoryResponse*) override;

  ::grpc::Status ListAuditEvents(::grpc::ServerContext*,
                                 const circulation::v1::ListAuditEventsRequest*,
                                 circulation::v1::ListAuditEventsResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const circulation::v1::StatsRequest*,
                       circulation::v1::StatsResponse*) override;

private:
  std::shared_ptr<circulation::service::AdminService> service_;
};

}
