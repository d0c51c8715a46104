#include "maintenance_worker.hpp"

#include "internal/observability/logging.hpp"
#include "recovery_sweep.hpp"

namespace circulation::maintenance {

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<RecoverySweep> sweep, std::chrono::milliseconds interval)
    : sweep_(std::move(sweep)), interval_(interval) {
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  SweepOnce();
  thread_ = std::thread(&MaintenanceWorker::Run, this);
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void MaintenanceWorker::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, interval_, [this] { return !running_; });
    if (!running_) {
      break;
    }

    lock.unlock();
    SweepOnce();
    lock.lock();
  }
}

void MaintenanceWorker::SweepOnce() {
  try {
    sweep_->Run();
  } catch (const std::exception& e) {
    CIRCULATION_LOG_ERROR("maintenance sweep failed", {observability::StringField("error", e.what())});
  }
}

} // namespace circulation::maintenance
