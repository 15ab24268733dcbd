#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "example_shipment.h"
#include "internal/config/config_loader.hpp"
#include "internal/config/credentials.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/transport/curl_transport.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage   = 2;

struct Options {
  std::string config_path;
  std::string shipment_path;
  bool        debug = false;
};

void Usage() {
  std::cout << "Usage:\n"
            << "  shipx-courier [--config <config.yaml>] [--shipment <shipment.json>] [--debug]\n"
            << "\n"
            << "Credentials come from INPOST_API_TOKEN / INPOST_ORGANIZATION_ID or the config file.\n"
            << "Without --shipment the built-in sandbox example is shipped.\n";
}

bool ParseArgs(int argc, char** argv, Options* options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      options->config_path = argv[++i];
    } else if (arg == "--shipment" && i + 1 < argc) {
      options->shipment_path = argv[++i];
    } else if (arg == "--debug") {
      options->debug = true;
    } else {
      return false;
    }
  }
  return true;
}

shipx::courier::v1::ShipmentRequest LoadShipment(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open shipment file " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  shipx::courier::v1::ShipmentRequest request;
  auto                                status = google::protobuf::util::JsonStringToMessage(buffer.str(), &request, options);
  if (!status.ok()) {
    throw std::runtime_error("invalid shipment file " + path + ": " + std::string(status.message()));
  }
  return request;
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseArgs(argc, argv, &options)) {
    Usage();
    return kExitUsage;
  }

  // ------------------------------------------------------------
  // Configuration and credentials; nothing is logged yet
  // ------------------------------------------------------------
  shipx::runtime::config::RuntimeConfig config;
  shipx::config::Credentials            credentials;
  shipx::courier::v1::ShipmentRequest   request;
  try {
    if (options.config_path.empty()) {
      shipx::config::ConfigLoader::ApplyDefaults(&config);
    } else {
      config = shipx::config::ConfigLoader::LoadFromYaml(options.config_path);
    }
    if (options.debug) {
      config.mutable_logging()->set_debug_requests(true);
    }

    if (auto resolved = shipx::config::ResolveCredentials(config, &credentials); !resolved) {
      std::cerr << "Initialization error: " << resolved.message << std::endl;
      return kExitUsage;
    }

    request = options.shipment_path.empty() ? shipx::cli::ExampleShipment() : LoadShipment(options.shipment_path);
  } catch (const std::exception& e) {
    std::cerr << "Initialization error: " << e.what() << std::endl;
    return kExitUsage;
  }

  // ------------------------------------------------------------
  // Run the workflow
  // ------------------------------------------------------------
  int exit_code = kExitFailure;
  try {
    shipx::transport::CurlGlobal curl;

    auto logger = shipx::observability::InitializeLogging(config);
    shipx::observability::InitializeTracing(config);

    if (!config.api().verify_tls()) {
      SHIPX_LOG_WARN("TLS certificate verification is disabled", {shipx::observability::StringField("base_url", config.api().base_url())});
    }
    SHIPX_LOG_INFO("Shipment workflow started",
                   {shipx::observability::StringField("base_url", config.api().base_url()),
                    shipx::observability::StringField("output", config.output().directory()),
                    shipx::observability::IntField("max_attempts", config.poll().max_attempts())});

    auto runtime = shipx::factory::Build(config, credentials, logger);
    auto result  = runtime.workflow->Run(request);
    if (result) {
      const auto& summary = runtime.workflow->Summary();
      std::cout << "Shipment workflow completed" << std::endl;
      std::cout << "  label:    " << summary.label_path.string() << "\n"
                << "  printout: " << summary.printout_path.string() << std::endl;
      exit_code = kExitSuccess;
    } else {
      std::cout << "Error occurred: " << result.message << std::endl;
    }
  } catch (const std::exception& e) {
    SHIPX_LOG_ERROR("General error", {shipx::observability::StringField("error", e.what())});
    std::cerr << "Error occurred: " << e.what() << std::endl;
  }

  shipx::observability::ShutdownTracing();
  shipx::observability::ShutdownLogging();
  return exit_code;
}
