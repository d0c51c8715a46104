#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "circulation/v1/circulation_service.grpc.pb.h"
#include "internal/service/circulation_service.hpp"

namespace circulation::grpc {

class CirculationServer final : public circulation::v1::CirculationService::Service {
public:
  explicit CirculationServer(std::shared_ptr<circulation::service::CirculationService> svc);

  ::grpc::Status Checkout(::grpc::ServerContext*,
                          const circulation::v1::CheckoutRequest*,
                          circulation::v1::CheckoutResponse*) override;

  ::grpc::Status ReturnCopy(::grpc::ServerContext*,
                            const circulation::v1::ReturnCopyRequest*,
                            circulation::v1::ReturnCopyResponse*) override;

  ::grpc::Status Renew(::grpc::ServerContext*,
                       const circulation::v1::RenewRequest*,
                       circulation::v1::RenewResponse*) override;

  ::grpc::Status ReportLost(::grpc::ServerContext*,
                            const circulation::v1::ReportLostRequest*,
                            circulation::v1::ReportLostResponse*) override;

  ::grpc::Status GetActiveLoan(::grpc::ServerContext*,
                               const circulation::v1::GetActiveLoanRequest*,
                               circulation::v1::GetActiveLoanResponse*) override;

  ::grpc::Status ListLoans(::grpc::ServerContext*,
                           const circulation::v1::ListLoansRequest*,
                           circulation::v1::ListLoansResponse*) override;

private:
  std::shared_ptr<circulation::service::CirculationService> service_;
};

}
