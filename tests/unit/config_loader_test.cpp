#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "shipx_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestQuotedNumericScalarStaysString() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(credentials:
  api_token: "abc.def"
  organization_id: "12345"
)");

  auto config = shipx::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.credentials().organization_id() == "12345");
  assert(config.credentials().api_token() == "abc.def");
}

void TestUnquotedNumericScalarForStringFieldKeepsText() {
  const auto yaml_path = WriteYaml("unquoted_numeric",
                                   R"(credentials:
  api_token: 987654
  organization_id: 0012345
output:
  label_type: 6
  directory: 2024
poll:
  interval_ms: 500
  fail_statuses: [404, cancelled]
)");

  auto config = shipx::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.credentials().organization_id() == "0012345");
  assert(config.credentials().api_token() == "987654");
  assert(config.output().label_type() == "6");
  assert(config.output().directory() == "2024");
  assert(config.poll().interval_ms() == 500);
  assert(config.poll().fail_statuses_size() == 2);
  assert(config.poll().fail_statuses(0) == "404");
}

void TestFlowStyleCredentialsWithNumericOrganization() {
  const auto yaml_path = WriteYaml("flow_credentials", "credentials: {api_token: t, organization_id: 12345}\n");

  auto config = shipx::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.credentials().api_token() == "t");
  assert(config.credentials().organization_id() == "12345");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(output:
  directory: "C:\\labels\\\"quoted\"\\out"
)");

  auto config = shipx::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.output().directory() == "C:\\labels\\\"quoted\"\\out");
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(api:
  base_url: https://api-shipx-pl.easypack24.net/v1/
  request_timeout_ms: 5000
  verify_tls: true
poll:
  interval_ms: 250
  max_attempts: 12
  fail_statuses: [cancelled, returned_to_sender]
output:
  directory: /var/tmp/labels
  label_type: normal
logging:
  level: debug
  file: /var/tmp/shipx.log
  debug_requests: true
)");

  auto config = shipx::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.api().base_url() == "https://api-shipx-pl.easypack24.net/v1");
  assert(config.api().request_timeout_ms() == 5000);
  assert(config.api().verify_tls());
  assert(config.poll().interval_ms() == 250);
  assert(config.poll().max_attempts() == 12);
  assert(config.poll().fail_statuses_size() == 2);
  assert(config.poll().fail_statuses(1) == "returned_to_sender");
  assert(config.output().directory() == "/var/tmp/labels");
  assert(config.output().label_type() == "normal");
  assert(config.output().label_format() == "Pdf");
  assert(config.logging().debug_requests());
}

void TestDefaultsFillMissingSections() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = shipx::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.api().base_url() == shipx::config::kSandboxBaseUrl);
  assert(config.api().request_timeout_ms() == 30000);
  assert(!config.api().verify_tls());
  assert(config.poll().interval_ms() == 1000);
  assert(config.poll().max_attempts() == 300);
  assert(config.poll().fail_statuses_size() == 0);
  assert(config.output().directory() == "tmp");
  assert(config.output().label_format() == "Pdf");
  assert(config.output().label_type() == "A6");
  assert(config.output().printout_format() == "Pdf");
  assert(config.logging().file() == "log.txt");
  assert(config.logging().level() == "info");
}

void TestExplicitZeroMaxAttemptsIsKept() {
  const auto yaml_path = WriteYaml("unbounded",
                                   R"(poll:
  max_attempts: 0
)");

  auto config = shipx::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.poll().has_max_attempts());
  assert(config.poll().max_attempts() == 0);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(api:
  base_url: "https://example.test"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)shipx::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)shipx::config::ConfigLoader::LoadFromYaml("/nonexistent/shipx/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestQuotedNumericScalarStaysString();
  TestUnquotedNumericScalarForStringFieldKeepsText();
  TestFlowStyleCredentialsWithNumericOrganization();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestFullConfigIsParsed();
  TestDefaultsFillMissingSections();
  TestExplicitZeroMaxAttemptsIsKept();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "shipx_unit_config_loader: pass\n";
  return 0;
}
