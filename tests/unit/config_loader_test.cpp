#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/policy.hpp"

namespace {

using circulation::config::ConfigLoader;
using circulation::config::ResolvePolicy;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "circulation_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "/var/lib/circulation/circulation.db"
loans:
  loan_period: "604800s"
  max_renewals: 3
  max_active_loans_per_user: 10
users:
  suspended:
    - mallory
    - trudy
idempotency:
  retention: "3600s"
  in_flight_lease: "30s"
  poll_interval: "0.050s"
requests:
  default_timeout: "2s"
maintenance:
  interval: "15s"
  audit_retry_attempts: 5
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/circulation/circulation.db");
  assert(config.loans().max_renewals() == 3);
  assert(config.users().suspended_size() == 2);
  assert(config.users().suspended(1) == "trudy");
  assert(config.logging().level() == "debug");

  auto policy = ResolvePolicy(config);
  assert(policy.loan_period == std::chrono::hours(24 * 7));
  assert(policy.max_renewals == 3);
  assert(policy.max_active_loans_per_user == 10);
  assert(policy.suspended_users.size() == 2);
  assert(policy.suspended_users[0] == "mallory");
  assert(policy.idempotency_retention == std::chrono::hours(1));
  assert(policy.in_flight_lease == std::chrono::seconds(30));
  assert(policy.poll_interval == std::chrono::milliseconds(50));
  assert(policy.default_request_timeout == std::chrono::seconds(2));
  assert(policy.maintenance_interval == std::chrono::seconds(15));
  assert(policy.audit_retry_attempts == 5);
}

void TestEmptyDocumentUsesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.has_server());
  assert(config.database().backend_case() == circulation::runtime::config::DatabaseConfig::BACKEND_NOT_SET);

  auto policy = ResolvePolicy(config);
  assert(policy.loan_period == std::chrono::hours(24 * 14));
  assert(policy.max_renewals == 2);
  assert(policy.max_active_loans_per_user == 5);
  assert(policy.suspended_users.empty());
  assert(policy.poll_interval == std::chrono::milliseconds(20));
  assert(policy.default_request_timeout == std::chrono::seconds(5));
}

void TestZeroValuesFallBackToDefaults() {
  auto config = ConfigLoader::LoadFromYamlString(R"(loans:
  loan_period: "0s"
  max_renewals: 0
requests:
  default_timeout: "0s"
)");

  auto policy = ResolvePolicy(config);
  assert(policy.loan_period == std::chrono::hours(24 * 14));
  assert(policy.max_renewals == 2);
  assert(policy.default_request_timeout == std::chrono::seconds(5));
}

void TestMemoryBackendSelection() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
loans:
  max_renewals: 2
  grace_period: "1s"
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMalformedDurationIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(requests:
  default_timeout: "five seconds"
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/circulation.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentUsesDefaults();
  TestZeroValuesFallBackToDefaults();
  TestMemoryBackendSelection();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMalformedDurationIsRejected();
  TestMissingFileIsRejected();

  std::cout << "circulation_unit_config_loader: pass\n";
  return 0;
}
