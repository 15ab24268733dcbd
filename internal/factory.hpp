#pragma once

#include <memory>

#include "config/config.pb.h"

#include "client/cpp/shipx_client.h"
#include "internal/config/credentials.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/transport/http_transport.hpp"
#include "internal/workflow/shipment_workflow.hpp"

namespace spdlog {
class logger;
}

namespace shipx::factory {

/*
  Runtime

  Owns everything one CLI invocation needs. Lives for the whole process.
*/
struct Runtime {
  shipx::transport::HttpTransportPtr                 transport;
  std::shared_ptr<shipx::client::ShipxClient>        client;
  std::shared_ptr<shipx::storage::ArtifactStore>     artifacts;
  std::unique_ptr<shipx::workflow::ShipmentWorkflow> workflow;
};

/*
  Build

  Composition root. The only place that knows the concrete transport; pass
  `transport` to substitute one (tests), otherwise libcurl is used.
*/
Runtime Build(const shipx::runtime::config::RuntimeConfig& config, const shipx::config::Credentials& credentials,
              std::shared_ptr<spdlog::logger> logger, shipx::transport::HttpTransportPtr transport = nullptr);

} // namespace shipx::factory
