#include "circulation_server.hpp"

#include "grpc_error.hpp"
#include "request_metadata.hpp"

namespace circulation::grpc {

CirculationServer::CirculationServer(std::shared_ptr<circulation::service::CirculationService> svc)
    : service_(std::move(svc)) {}

::grpc::Status CirculationServer::Checkout(::grpc::ServerContext* context,
                                           const circulation::v1::CheckoutRequest* req,
                                           circulation::v1::CheckoutResponse* resp) {
  try {
    *resp = service_->Checkout(*req, FromServerContext(context, req->user_id()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CirculationServer::ReturnCopy(::grpc::ServerContext* context,
                                             const circulation::v1::ReturnCopyRequest* req,
                                             circulation::v1::ReturnCopyResponse* resp) {
  try {
    *resp = service_->ReturnCopy(*req, FromServerContext(context, req->user_id()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CirculationServer::Renew(::grpc::ServerContext* context,
                                        const circulation::v1::RenewRequest* req,
                                        circulation::v1::RenewResponse* resp) {
  try {
    *resp = service_->Renew(*req, FromServerContext(context, {}));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CirculationServer::ReportLost(::grpc::ServerContext* context,
                                             const circulation::v1::ReportLostRequest* req,
                                             circulation::v1::ReportLostResponse* resp) {
  try {
    *resp = service_->ReportLost(*req, FromServerContext(context, {}));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CirculationServer::GetActiveLoan(::grpc::ServerContext*,
                                                const circulation::v1::GetActiveLoanRequest* req,
                                                circulation::v1::GetActiveLoanResponse* resp) {
  try {
    *resp = service_->GetActiveLoan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CirculationServer::ListLoans(::grpc::ServerContext*,
                                            const circulation::v1::ListLoansRequest* req,
                                            circulation::v1::ListLoansResponse* resp) {
  try {
    *resp = service_->ListLoans(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
