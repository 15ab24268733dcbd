#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

#include "api/shipx/courier/v1.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"
#include "internal/workflow/confirmation_policy.hpp"

namespace spdlog {
class logger;
}
namespace shipx::client {
class ShipxClient;
struct ApiCall;
}
namespace shipx::storage {
class ArtifactStore;
}

namespace shipx::workflow {

using Sleeper     = std::function<void(std::chrono::milliseconds)>;
using ClockSource = std::function<shipx::util::TimePoint()>;

struct WorkflowDependencies {
  std::shared_ptr<shipx::client::ShipxClient>    client;
  std::shared_ptr<shipx::storage::ArtifactStore> artifacts;
  std::shared_ptr<spdlog::logger>                logger;

  // Defaults: std::this_thread::sleep_for, util::Now, std::cout.
  Sleeper       sleeper;
  ClockSource   clock;
  std::ostream* console = nullptr;
};

struct WorkflowOptions {
  ConfirmationPolicy confirmation;
  std::string        label_format    = "Pdf";
  std::string        label_type      = "A6";
  std::string        printout_format = "Pdf";
  // Log every outgoing request before it is sent.
  bool debug_requests = false;
};

// What a successful run produced.
struct RunSummary {
  std::int64_t          shipment_id       = 0;
  std::int64_t          dispatch_point_id = 0;
  std::int64_t          dispatch_order_id = 0;
  std::string           shipment_status;
  std::string           tracking_number;
  std::string           collection_date;
  std::uint32_t         poll_attempts = 0;
  std::filesystem::path label_path;
  std::filesystem::path printout_path;
};

/*
  ShipmentWorkflow

  Drives one shipment through the courier API:

    create shipment → wait for "confirmed" → label PDF
      → dispatch order → dispatch printout PDF

  Strictly sequential. The first failing step logs one error entry (endpoint,
  payload, provider error) and ends the run; nothing already created on the
  provider side is rolled back.
*/
class ShipmentWorkflow {
 public:
  ShipmentWorkflow(WorkflowDependencies deps, WorkflowOptions options);

  shipx::util::Result Run(const shipx::courier::v1::ShipmentRequest& request);

  // Valid after Run() returned OK.
  const RunSummary& Summary() const {
    return summary_;
  }

  // Pickup at the receiver address, sender as the contact, collection the
  // day after `now`.
  static shipx::courier::v1::DispatchOrderRequest BuildDispatchOrder(const shipx::courier::v1::ShipmentRequest& request,
                                                                     std::int64_t shipment_id, std::string_view shipment_status,
                                                                     std::int64_t dispatch_point_id, shipx::util::TimePoint now);

  static shipx::util::Result ValidateRequest(const shipx::courier::v1::ShipmentRequest& request);

 private:
  shipx::util::Result RunSteps(const shipx::courier::v1::ShipmentRequest& request);

  shipx::util::Result CreateShipment(const shipx::courier::v1::ShipmentRequest& request, shipx::courier::v1::ShipmentResult* created);
  shipx::util::Result WaitForConfirmation(std::int64_t shipment_id, shipx::courier::v1::ShipmentResult* confirmed);
  shipx::util::Result GenerateLabel(std::int64_t shipment_id);
  shipx::util::Result CreateDispatchOrder(const shipx::courier::v1::DispatchOrderRequest& order,
                                          shipx::courier::v1::DispatchOrderResult* created);
  shipx::util::Result GeneratePrintout(std::int64_t dispatch_order_id, std::int64_t shipment_id);

  void LogRequest(std::string_view message, const std::string& endpoint, const std::string& payload);
  void LogFailure(std::string_view step, std::string_view message, const shipx::client::ApiCall& call,
                  const shipx::util::Result& result);
  void Spin();
  void ClearSpinner();

  WorkflowDependencies deps_;
  WorkflowOptions      options_;
  RunSummary           summary_;
  std::size_t          spinner_index_  = 0;
  bool                 spinner_active_ = false;
};

} // namespace shipx::workflow
