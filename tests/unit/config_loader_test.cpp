#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "vesting_ledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::filesystem::path& path) {
  try {
    (void)vesting::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/tmp/vesting.db"
    wal_mode: true
logging:
  level: debug
observability:
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
  metrics:
    collection_interval_ms: 5000
governance:
  administrator: "0x00000000000000000000000000000000000a11ce"
  recovery_account: 0x000000000000000000000000000000000000b0b0
token_ledger:
  custody_account: custody
  initial_balances:
    "0x00000000000000000000000000000000000a11ce": 18446744073709551615
    "0x0000000000000000000000000000000000000b0b": 250
limits:
  max_schedules_per_beneficiary: 64
  max_batch_size: 256
)");

  auto config = vesting::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/vesting.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == vesting::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().metrics().collection_interval_ms() == 5000);
  assert(config.limits().max_schedules_per_beneficiary() == 64);
  assert(config.limits().max_batch_size() == 256);
}

void TestAddressesAndLargeAmountsSurvive() {
  const auto yaml_path = WriteYaml("addresses",
                                   R"(governance:
  administrator: "0x00000000000000000000000000000000000a11ce"
  recovery_account: 0x000000000000000000000000000000000000b0b0
token_ledger:
  initial_balances:
    "0x00000000000000000000000000000000000a11ce": 18446744073709551615
    "0x0000000000000000000000000000000000000b0b": 250
)");

  auto config = vesting::config::ConfigLoader::LoadFromYaml(yaml_path.string());

  // an unquoted hex address must not be read as a number
  assert(config.governance().recovery_account() == "0x000000000000000000000000000000000000b0b0");
  assert(config.governance().administrator() == "0x00000000000000000000000000000000000a11ce");

  const auto& balances = config.token_ledger().initial_balances();
  assert(balances.size() == 2);
  assert(balances.at("0x00000000000000000000000000000000000a11ce") == 18446744073709551615ULL);
  assert(balances.at("0x0000000000000000000000000000000000000b0b") == 250);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\vesting\\\"quoted\"\\ledger.sqlite"
    wal_mode: false
)");

  auto config = vesting::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\vesting\\\"quoted\"\\ledger.sqlite");
}

void TestMemoryBackendSelectedByEmptyMap() {
  const auto yaml_path = WriteYaml("memory_backend",
                                   R"(database:
  memory: {}
)");

  auto config = vesting::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  assert(LoadThrows(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestNegativeLimitIsRejected() {
  const auto yaml_path = WriteYaml("negative_limit",
                                   R"(limits:
  max_batch_size: -1
)");

  assert(LoadThrows(yaml_path));
}

void TestMissingFileIsRejected() {
  assert(LoadThrows(std::filesystem::temp_directory_path() / "vesting_ledger_config_loader_tests" / "does_not_exist.yaml"));
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestAddressesAndLargeAmountsSurvive();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestMemoryBackendSelectedByEmptyMap();
  TestUnknownFieldsAreRejected();
  TestNegativeLimitIsRejected();
  TestMissingFileIsRejected();

  std::cout << "vesting_unit_config_loader: pass\n";
  return 0;
}
