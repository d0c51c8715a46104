#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/config/policy.hpp"
#include "internal/service/service_context.hpp"

namespace circulation::maintenance {
class MaintenanceWorker;
class RecoverySweep;
} // namespace circulation::maintenance

namespace circulation::service {
class AdminService;
class CirculationService;
} // namespace circulation::service

namespace circulation::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  config::Policy          policy;
  service::ServiceContext context;

  std::shared_ptr<service::CirculationService> circulation_service;
  std::shared_ptr<service::AdminService>       admin_service;

  std::shared_ptr<maintenance::RecoverySweep>     recovery_sweep;
  std::shared_ptr<maintenance::MaintenanceWorker> maintenance_worker;
};

/*
  Build

  Constructs the entire backend based on runtime config. The maintenance
  worker is created but not started.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const circulation::runtime::config::RuntimeConfig& config);

} // namespace circulation::factory
