#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace circulation::maintenance {

class RecoverySweep;

/*
  Background worker running the recovery sweep every interval.

  Start() runs one sweep synchronously before the thread starts, so
  markers orphaned by a previous process are resolved before serving.
*/
class MaintenanceWorker {
 public:
  MaintenanceWorker(std::shared_ptr<RecoverySweep> sweep, std::chrono::milliseconds interval);
  ~MaintenanceWorker();

  void Start();
  void Stop();

 private:
  void Run();
  void SweepOnce();

  std::shared_ptr<RecoverySweep> sweep_;
  std::chrono::milliseconds      interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace circulation::maintenance
