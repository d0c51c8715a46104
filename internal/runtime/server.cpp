#include "server.hpp"

#include <stdexcept>

#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/circulation_server.hpp"
#include "internal/observability/logging.hpp"

namespace circulation::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, grpc::InsecureServerCredentials());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  CIRCULATION_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_)});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

std::vector<std::unique_ptr<grpc::Service>> BuildGrpcServices(const factory::Application& app) {
  std::vector<std::unique_ptr<grpc::Service>> services;
  services.push_back(std::make_unique<circulation::grpc::CirculationServer>(app.circulation_service));
  services.push_back(std::make_unique<circulation::grpc::AdminServer>(app.admin_service));
  return services;
}

} // namespace circulation::runtime
