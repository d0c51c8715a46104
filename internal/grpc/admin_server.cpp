#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "request_metadata.hpp"

namespace circulation::grpc {

AdminServer::AdminServer(std::shared_ptr<circulation::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::RegisterCopy(::grpc::ServerContext* context, const circulation::v1::RegisterCopyRequest* req,
                                         circulation::v1::RegisterCopyResponse* resp) {
  try {
    *resp = service_->RegisterCopy(*req, FromServerContext(context, {}));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RetireCopy(::grpc::ServerContext* context, const circulation::v1::RetireCopyRequest* req,
                                       circulation::v1::RetireCopyResponse* resp) {
  try {
    *resp = service_->RetireCopy(*req, FromServerContext(context, {}));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetCopy(::grpc::ServerContext* context, const circulation::v1::GetCopyRequest* req,
                                    circulation::v1::GetCopyResponse* resp) {
  try {
    *resp = service_->GetCopy(*req, FromServerContext(context, {}));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetLoanHistory(::grpc::ServerContext* context, const circulation::v1::GetLoanHistoryRequest* req,
                                           circulation::v1::GetLoanHistoryResponse* resp) {
  try {
    *resp = service_->GetLoanHistory(*req, FromServerContext(context, {}));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListAuditEvents(::grpc::ServerContext* context, const circulation::v1::ListAuditEventsRequest* req,
                                            circulation::v1::ListAuditEventsResponse* resp) {
  try {
    *resp = service_->ListAuditEvents(*req, FromServerContext(context, {}));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext* context, const circulation::v1::StatsRequest* req, circulation::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req, FromServerContext(context, {}));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace circulation::grpc
