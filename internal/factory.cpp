#include "factory.hpp"

#include <chrono>
#include <utility>

#include "internal/transport/curl_transport.hpp"
#include "internal/workflow/confirmation_policy.hpp"

namespace shipx::factory {

Runtime Build(const shipx::runtime::config::RuntimeConfig& config, const shipx::config::Credentials& credentials,
              std::shared_ptr<spdlog::logger> logger, shipx::transport::HttpTransportPtr transport) {
  Runtime runtime;

  if (!transport) {
    shipx::transport::CurlOptions options;
    options.timeout    = std::chrono::milliseconds(config.api().request_timeout_ms());
    options.verify_tls = config.api().verify_tls();
    options.user_agent = config.api().user_agent();
    transport          = std::make_shared<shipx::transport::CurlTransport>(std::move(options));
  }
  runtime.transport = transport;

  runtime.client    = std::make_shared<shipx::client::ShipxClient>(runtime.transport, config.api().base_url(), credentials);
  runtime.artifacts = std::make_shared<shipx::storage::ArtifactStore>(config.output().directory());

  shipx::workflow::WorkflowDependencies deps;
  deps.client    = runtime.client;
  deps.artifacts = runtime.artifacts;
  deps.logger    = std::move(logger);

  shipx::workflow::WorkflowOptions options;
  options.confirmation    = shipx::workflow::ConfirmationPolicy::FromConfig(config.poll());
  options.label_format    = config.output().label_format();
  options.label_type      = config.output().label_type();
  options.printout_format = config.output().printout_format();
  options.debug_requests  = config.logging().debug_requests();

  runtime.workflow = std::make_unique<shipx::workflow::ShipmentWorkflow>(std::move(deps), std::move(options));
  return runtime;
}

} // namespace shipx::factory
