#include "internal/workflow/shipment_workflow.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "client/cpp/shipx_client.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/artifact_store.hpp"

namespace shipx::workflow {

using namespace shipx::courier::v1;
using shipx::client::ApiCall;
using shipx::observability::BoolField;
using shipx::observability::IntField;
using shipx::observability::Log;
using shipx::observability::StringField;
using shipx::util::ErrorCode;
using shipx::util::Result;

namespace {

constexpr char kSpinner[] = {'|', '/', '-', '\\'};

// Messages for the log have no use for a JSON encoding error; fall back to
// the debug string.
std::string Dump(const google::protobuf::Message& message) {
  std::string json;
  if (!shipx::client::ShipxClient::ToJson(message, &json)) {
    return message.ShortDebugString();
  }
  return json;
}

} // namespace

ShipmentWorkflow::ShipmentWorkflow(WorkflowDependencies deps, WorkflowOptions options)
    : deps_(std::move(deps)), options_(std::move(options)) {
  if (!deps_.client) {
    throw std::invalid_argument("ShipmentWorkflow requires a client");
  }
  if (!deps_.artifacts) {
    throw std::invalid_argument("ShipmentWorkflow requires an artifact store");
  }
  if (!deps_.logger) {
    deps_.logger = spdlog::default_logger();
  }
  if (!deps_.sleeper) {
    deps_.sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
  if (!deps_.clock) {
    deps_.clock = &shipx::util::Now;
  }
  if (deps_.console == nullptr) {
    deps_.console = &std::cout;
  }
}

Result ShipmentWorkflow::ValidateRequest(const ShipmentRequest& request) {
  if (!request.has_receiver() || !request.receiver().has_address()) {
    return Result::Err(ErrorCode::kConfiguration, "shipment request has no receiver address");
  }
  if (!request.has_sender() || !request.sender().has_address()) {
    return Result::Err(ErrorCode::kConfiguration, "shipment request has no sender address");
  }
  if (request.parcels_size() == 0) {
    return Result::Err(ErrorCode::kConfiguration, "shipment request has no parcels");
  }
  if (request.service().empty()) {
    return Result::Err(ErrorCode::kConfiguration, "shipment request has no service");
  }
  return Result::Ok();
}

DispatchOrderRequest ShipmentWorkflow::BuildDispatchOrder(const ShipmentRequest& request, std::int64_t shipment_id,
                                                          std::string_view shipment_status, std::int64_t dispatch_point_id,
                                                          shipx::util::TimePoint now) {
  DispatchOrderRequest order;
  order.set_status(std::string(shipment_status));
  order.add_shipments(std::to_string(shipment_id));
  if (dispatch_point_id > 0) {
    order.set_dispatch_point_id(std::to_string(dispatch_point_id));
  }
  *order.mutable_address() = request.receiver().address();

  const auto& sender   = request.sender();
  auto*       contact  = order.mutable_contact();
  std::string fullname = sender.first_name();
  if (!sender.last_name().empty()) {
    fullname += fullname.empty() ? sender.last_name() : " " + sender.last_name();
  }
  contact->set_name(fullname);
  contact->set_phone(sender.phone());
  contact->set_email(sender.email());

  order.set_collection_date(shipx::util::NextDay(now));
  return order;
}

Result ShipmentWorkflow::Run(const ShipmentRequest& request) {
  summary_        = RunSummary{};
  spinner_index_  = 0;
  spinner_active_ = false;

  observability::SpanScope span("shipment_workflow.run");
  try {
    auto result = RunSteps(request);
    if (!result) {
      span.RecordException(result.message);
    }
    return result;
  } catch (const std::exception& e) {
    ClearSpinner();
    Log(*deps_.logger, spdlog::level::err, "General error", {StringField("step", "workflow"), StringField("error", e.what())});
    span.RecordException(e.what());
    return Result::Err(ErrorCode::kInternal, e.what());
  }
}

Result ShipmentWorkflow::RunSteps(const ShipmentRequest& request) {
  if (auto valid = ValidateRequest(request); !valid) {
    Log(*deps_.logger, spdlog::level::err, "Shipment request invalid",
        {StringField("step", "validate"), StringField("error", valid.message)});
    return valid;
  }

  Log(*deps_.logger, spdlog::level::info, "Receiver address",
      {StringField("step", "prepare"), StringField("payload", Dump(request.receiver().address()))});

  ShipmentResult created;
  if (auto result = CreateShipment(request, &created); !result) {
    return result;
  }
  summary_.shipment_id       = created.id();
  summary_.dispatch_point_id = created.sender().id();

  ShipmentResult confirmed;
  if (auto result = WaitForConfirmation(summary_.shipment_id, &confirmed); !result) {
    return result;
  }
  summary_.shipment_status = confirmed.status();
  summary_.tracking_number = confirmed.tracking_number();
  // the confirmed record is authoritative for the dispatch point when present
  if (confirmed.sender().id() > 0) {
    summary_.dispatch_point_id = confirmed.sender().id();
  }

  if (auto result = GenerateLabel(summary_.shipment_id); !result) {
    return result;
  }

  const auto order = BuildDispatchOrder(request, summary_.shipment_id, summary_.shipment_status, summary_.dispatch_point_id,
                                        deps_.clock());
  summary_.collection_date = order.collection_date();

  DispatchOrderResult dispatch;
  if (auto result = CreateDispatchOrder(order, &dispatch); !result) {
    return result;
  }
  summary_.dispatch_order_id = dispatch.id();

  if (auto result = GeneratePrintout(summary_.dispatch_order_id, summary_.shipment_id); !result) {
    return result;
  }

  (*deps_.console) << "Courier ordered for shipment ID: " << summary_.shipment_id << "\n";
  Log(*deps_.logger, spdlog::level::info, "Shipment workflow completed",
      {StringField("step", "complete"), IntField("shipment_id", summary_.shipment_id),
       IntField("dispatch_order_id", summary_.dispatch_order_id), StringField("label", summary_.label_path.string()),
       StringField("printout", summary_.printout_path.string())});
  return Result::Ok();
}

Result ShipmentWorkflow::CreateShipment(const ShipmentRequest& request, ShipmentResult* created) {
  observability::SpanScope span("shipment_workflow.create_shipment");

  if (options_.debug_requests) {
    LogRequest("Shipment request", deps_.client->ShipmentsEndpoint(), Dump(request));
  }

  ApiCall call;
  auto    result = deps_.client->CreateShipment(request, created, &call);
  if (!result) {
    LogFailure("create_shipment", "Shipment creation failed", call, result);
    span.RecordException(result.message);
    return result;
  }

  span.SetAttribute("shipment.id", created->id());
  Log(*deps_.logger, spdlog::level::info, "Shipment created",
      {StringField("step", "create_shipment"), IntField("shipment_id", created->id()), StringField("status", created->status()),
       StringField("payload", call.response_body)});
  return Result::Ok();
}

Result ShipmentWorkflow::WaitForConfirmation(std::int64_t shipment_id, ShipmentResult* confirmed) {
  observability::SpanScope span("shipment_workflow.wait_for_confirmation");
  span.SetAttribute("shipment.id", shipment_id);

  const auto& policy = options_.confirmation;
  for (std::uint32_t attempt = 1;; ++attempt) {
    if (attempt > 1) {
      deps_.sleeper(policy.interval);
    }

    ApiCall        call;
    ShipmentResult polled;
    auto           result = deps_.client->GetShipment(shipment_id, &polled, &call);
    summary_.poll_attempts = attempt;
    if (!result) {
      ClearSpinner();
      LogFailure("wait_for_confirmation", "Shipment status poll failed", call, result);
      span.RecordException(result.message);
      return result;
    }

    Spin();
    Log(*deps_.logger, spdlog::level::info, "Shipment status",
        {StringField("step", "wait_for_confirmation"), IntField("shipment_id", shipment_id), IntField("attempt", attempt),
         StringField("status", polled.status()), BoolField("confirmed", policy.IsConfirmed(polled.status()))});

    if (policy.IsConfirmed(polled.status())) {
      ClearSpinner();
      span.AddEvent("shipment.confirmed");
      (*deps_.console) << "Shipment confirmed\n";
      Log(*deps_.logger, spdlog::level::info, "Shipment details",
          {StringField("step", "wait_for_confirmation"), IntField("shipment_id", shipment_id), StringField("payload", call.response_body)});
      *confirmed = std::move(polled);
      return Result::Ok();
    }

    if (policy.IsFailure(polled.status())) {
      ClearSpinner();
      auto rejected = Result::Err(ErrorCode::kRejected, "shipment " + std::to_string(shipment_id) + " reached status " + polled.status());
      Log(*deps_.logger, spdlog::level::err, "Shipment rejected",
          {StringField("step", "wait_for_confirmation"), StringField("endpoint", call.endpoint), StringField("status", polled.status()),
           StringField("error", call.response_body)});
      span.RecordException(rejected.message);
      return rejected;
    }

    if (policy.Exhausted(attempt)) {
      ClearSpinner();
      auto timeout = Result::Err(ErrorCode::kTimeout, "shipment " + std::to_string(shipment_id) + " not confirmed after " +
                                                          std::to_string(attempt) + " attempts");
      Log(*deps_.logger, spdlog::level::err, "Shipment confirmation timed out",
          {StringField("step", "wait_for_confirmation"), StringField("endpoint", call.endpoint), IntField("attempts", attempt),
           StringField("status", polled.status()), StringField("error", timeout.message)});
      span.RecordException(timeout.message);
      return timeout;
    }
  }
}

Result ShipmentWorkflow::GenerateLabel(std::int64_t shipment_id) {
  observability::SpanScope span("shipment_workflow.generate_label");
  span.SetAttribute("shipment.id", shipment_id);

  if (options_.debug_requests) {
    LogRequest("Label request", deps_.client->LabelEndpoint(shipment_id, options_.label_format, options_.label_type), {});
  }

  ApiCall     call;
  std::string bytes;
  auto        result = deps_.client->GetLabel(shipment_id, options_.label_format, options_.label_type, &bytes, &call);
  if (!result) {
    LogFailure("generate_label", "Label generation failed", call, result);
    span.RecordException(result.message);
    return result;
  }

  const auto name = shipx::storage::ArtifactStore::LabelFileName(shipment_id);
  if (auto written = deps_.artifacts->Write(name, bytes, &summary_.label_path); !written) {
    Log(*deps_.logger, spdlog::level::err, "Label write failed",
        {StringField("step", "generate_label"), StringField("endpoint", call.endpoint), StringField("error", written.message)});
    span.RecordException(written.message);
    return written;
  }

  (*deps_.console) << "Label generated: " << name << "\n";
  Log(*deps_.logger, spdlog::level::info, "Label generated",
      {StringField("step", "generate_label"), StringField("path", summary_.label_path.string()), IntField("bytes", bytes.size())});
  return Result::Ok();
}

Result ShipmentWorkflow::CreateDispatchOrder(const DispatchOrderRequest& order, DispatchOrderResult* created) {
  observability::SpanScope span("shipment_workflow.create_dispatch_order");

  if (options_.debug_requests) {
    LogRequest("Dispatch order request", deps_.client->DispatchOrdersEndpoint(), Dump(order));
  }

  ApiCall call;
  auto    result = deps_.client->CreateDispatchOrder(order, created, &call);
  if (!result) {
    LogFailure("create_dispatch_order", "Dispatch order creation failed", call, result);
    span.RecordException(result.message);
    return result;
  }

  span.SetAttribute("dispatch_order.id", created->id());
  Log(*deps_.logger, spdlog::level::info, "Courier ordered",
      {StringField("step", "create_dispatch_order"), IntField("dispatch_order_id", created->id()),
       StringField("collection_date", order.collection_date()), StringField("payload", call.response_body)});
  return Result::Ok();
}

Result ShipmentWorkflow::GeneratePrintout(std::int64_t dispatch_order_id, std::int64_t shipment_id) {
  observability::SpanScope span("shipment_workflow.generate_printout");
  span.SetAttribute("dispatch_order.id", dispatch_order_id);

  if (options_.debug_requests) {
    LogRequest("Dispatch printout request", deps_.client->PrintoutEndpoint(dispatch_order_id, options_.printout_format), {});
  }

  ApiCall     call;
  std::string bytes;
  auto        result = deps_.client->GetDispatchPrintout(dispatch_order_id, options_.printout_format, &bytes, &call);
  if (!result) {
    LogFailure("generate_printout", "Dispatch printout generation failed", call, result);
    span.RecordException(result.message);
    return result;
  }

  const auto name = shipx::storage::ArtifactStore::PrintoutFileName(shipment_id);
  if (auto written = deps_.artifacts->Write(name, bytes, &summary_.printout_path); !written) {
    Log(*deps_.logger, spdlog::level::err, "Printout write failed",
        {StringField("step", "generate_printout"), StringField("endpoint", call.endpoint), StringField("error", written.message)});
    span.RecordException(written.message);
    return written;
  }

  (*deps_.console) << "Printout generated: " << name << "\n";
  Log(*deps_.logger, spdlog::level::info, "Printout generated",
      {StringField("step", "generate_printout"), StringField("path", summary_.printout_path.string()), IntField("bytes", bytes.size())});
  return Result::Ok();
}

void ShipmentWorkflow::LogRequest(std::string_view message, const std::string& endpoint, const std::string& payload) {
  if (payload.empty()) {
    Log(*deps_.logger, spdlog::level::debug, message, {StringField("endpoint", endpoint)});
    return;
  }
  Log(*deps_.logger, spdlog::level::debug, message, {StringField("endpoint", endpoint), StringField("payload", payload)});
}

void ShipmentWorkflow::LogFailure(std::string_view step, std::string_view message, const ApiCall& call, const Result& result) {
  Log(*deps_.logger, spdlog::level::err, message,
      {StringField("step", step), StringField("endpoint", call.endpoint), StringField("method", call.method),
       IntField("http_status", call.http_status), StringField("code", shipx::util::ToString(result.code)),
       StringField("payload", call.request_body), StringField("error", call.error.empty() ? result.message : call.error)});
}

void ShipmentWorkflow::Spin() {
  (*deps_.console) << "\rWaiting for shipment confirmation... " << kSpinner[spinner_index_] << std::flush;
  spinner_index_  = (spinner_index_ + 1) % sizeof(kSpinner);
  spinner_active_ = true;
}

void ShipmentWorkflow::ClearSpinner() {
  if (!spinner_active_) {
    return;
  }
  (*deps_.console) << "\r" << std::string(50, ' ') << "\r" << std::flush;
  spinner_active_ = false;
}

} // namespace shipx::workflow
