#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/idempotency/idempotency_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using circulation::db::memory::MemoryRepository;
using circulation::idempotency::BeginStatus;
using circulation::idempotency::IdempotencyCoordinator;

std::shared_ptr<IdempotencyCoordinator> MakeCoordinator(std::shared_ptr<MemoryRepository> repo,
                                                        std::chrono::milliseconds retention = std::chrono::hours(1)) {
  IdempotencyCoordinator::Options options;
  options.retention     = retention;
  options.poll_interval = std::chrono::milliseconds(5);
  return std::make_shared<IdempotencyCoordinator>(std::move(repo), options);
}

void TestFirstAttemptIsNewAndRetryReplays() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo);

  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kNew);
  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kDuplicateInFlight);

  coordinator->Complete("k1", "checkout", "fp", "cached-result");

  auto replay = coordinator->Begin("k1", "checkout", "fp");
  assert(replay.status == BeginStatus::kDuplicateCompleted);
  assert(replay.result == "cached-result");
}

void TestKeyReuseWithDifferentRequestIsRejected() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo);

  assert(coordinator->Begin("k1", "checkout", "fp-a").status == BeginStatus::kNew);
  assert(coordinator->Begin("k1", "checkout", "fp-b").status == BeginStatus::kKeyReuseMismatch);
  assert(coordinator->Begin("k1", "return", "fp-a").status == BeginStatus::kKeyReuseMismatch);

  coordinator->Complete("k1", "checkout", "fp-a", "r");
  assert(coordinator->Begin("k1", "checkout", "fp-b").status == BeginStatus::kKeyReuseMismatch);
}

void TestAbortLetsTheKeyExecuteAgain() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo);

  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kNew);
  coordinator->Abort("k1");
  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kNew);

  // Aborting an unknown or completed key is tolerated.
  coordinator->Abort("unknown");
  coordinator->Complete("k1", "checkout", "fp", "r");
  coordinator->Abort("k1");
  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kDuplicateCompleted);
}

void TestCompleteRecordsResultWhenMarkerIsGone() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo);

  // The marker was dropped while the operation was still executing.
  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kNew);
  coordinator->Abort("k1");
  coordinator->Complete("k1", "checkout", "fp", "late-result");

  auto replay = coordinator->Begin("k1", "checkout", "fp");
  assert(replay.status == BeginStatus::kDuplicateCompleted);
  assert(replay.result == "late-result");
  assert(coordinator->Begin("k1", "return", "fp").status == BeginStatus::kKeyReuseMismatch);

  // A key completed by another path keeps its first result.
  coordinator->Complete("k1", "checkout", "fp", "second-result");
  assert(coordinator->Begin("k1", "checkout", "fp").result == "late-result");
}

void TestEmptyKeyIsInvalid() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo);

  bool threw = false;
  try {
    (void)coordinator->Begin("", "checkout", "fp");
  } catch (const circulation::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestExactlyOneConcurrentBeginWins() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo);

  constexpr int            kThreads = 8;
  std::atomic<int>         winners{0};
  std::atomic<int>         duplicates{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      auto outcome = coordinator->Begin("shared", "checkout", "fp");
      if (outcome.status == BeginStatus::kNew) {
        ++winners;
      } else if (outcome.status == BeginStatus::kDuplicateInFlight) {
        ++duplicates;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(winners == 1);
  assert(duplicates == kThreads - 1);
}

void TestAwaitResolutionReturnsCompletedResult() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo);

  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kNew);

  std::thread completer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    coordinator->Complete("k1", "checkout", "fp", "done");
  });

  auto outcome = coordinator->AwaitResolution("k1", "checkout", "fp", circulation::util::DeadlineAfter(std::chrono::seconds(5)));
  completer.join();

  assert(outcome.status == BeginStatus::kDuplicateCompleted);
  assert(outcome.result == "done");
}

void TestAwaitResolutionTakesOverAbortedKey() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo);

  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kNew);

  std::thread aborter([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    coordinator->Abort("k1");
  });

  auto outcome = coordinator->AwaitResolution("k1", "checkout", "fp", circulation::util::DeadlineAfter(std::chrono::seconds(5)));
  aborter.join();

  assert(outcome.status == BeginStatus::kNew);
}

void TestAwaitResolutionTimesOut() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo);

  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kNew);

  bool timed_out = false;
  try {
    (void)coordinator->AwaitResolution("k1", "checkout", "fp", circulation::util::DeadlineAfter(std::chrono::milliseconds(40)));
  } catch (const circulation::util::Timeout&) {
    timed_out = true;
  }
  assert(timed_out);
}

void TestExpiredRecordsAreTreatedAsAbsent() {
  auto repo        = std::make_shared<MemoryRepository>();
  auto coordinator = MakeCoordinator(repo, std::chrono::milliseconds(1));

  assert(coordinator->Begin("k1", "checkout", "fp").status == BeginStatus::kNew);
  coordinator->Complete("k1", "checkout", "fp", "r");
  std::this_thread::sleep_for(std::chrono::milliseconds(10));

  // Different parameters are accepted once the old record expired.
  assert(coordinator->Begin("k1", "return", "other").status == BeginStatus::kNew);

  assert(coordinator->Begin("k2", "checkout", "fp").status == BeginStatus::kNew);
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  assert(coordinator->PurgeExpired(circulation::util::NowMs()) == 2);
}

} // namespace

int main() {
  TestFirstAttemptIsNewAndRetryReplays();
  TestKeyReuseWithDifferentRequestIsRejected();
  TestAbortLetsTheKeyExecuteAgain();
  TestCompleteRecordsResultWhenMarkerIsGone();
  TestEmptyKeyIsInvalid();
  TestExactlyOneConcurrentBeginWins();
  TestAwaitResolutionReturnsCompletedResult();
  TestAwaitResolutionTakesOverAbortedKey();
  TestAwaitResolutionTimesOut();
  TestExpiredRecordsAreTreatedAsAbsent();

  std::cout << "circulation_unit_idempotency_coordinator: pass\n";
  return 0;
}
