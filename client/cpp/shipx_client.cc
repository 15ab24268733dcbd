#include "client/cpp/shipx_client.h"

#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <string>
#include <string_view>
#include <utility>

#include "internal/transport/curl_transport.hpp"

namespace shipx::client {

namespace {

using shipx::transport::HttpMethod;
using shipx::transport::HttpRequest;
using shipx::transport::HttpResponse;
using shipx::util::ErrorCode;
using shipx::util::Result;

// Documents arrive as PDF or untyped bytes. Anything else (an error object
// sent with a 2xx status) must not be written out as a .pdf.
bool IsDocumentType(std::string_view content_type) {
  const auto params = content_type.find(';');
  if (params != std::string_view::npos) {
    content_type = content_type.substr(0, params);
  }
  while (!content_type.empty() && std::isspace(static_cast<unsigned char>(content_type.back()))) {
    content_type.remove_suffix(1);
  }

  std::string media_type;
  media_type.reserve(content_type.size());
  for (unsigned char c : content_type) {
    media_type.push_back(static_cast<char>(std::tolower(c)));
  }
  return media_type.empty() || media_type == "application/pdf" || media_type == "application/octet-stream";
}

Result RequireDocument(std::string_view what, ApiCall* call) {
  if (call->response_body.empty()) {
    call->error = std::string(what) + " body is empty";
    return Result::Err(ErrorCode::kProtocol, "GET " + call->endpoint + " returned an empty " + std::string(what));
  }
  if (!IsDocumentType(call->content_type)) {
    call->error = "unexpected content type " + call->content_type + ": " + call->response_body;
    return Result::Err(ErrorCode::kProtocol, "GET " + call->endpoint + " returned " + call->content_type + " instead of a " +
                                                 std::string(what));
  }
  return Result::Ok();
}

Result RequireId(std::int64_t id, std::string_view what) {
  if (id <= 0) {
    return Result::Err(ErrorCode::kProtocol, std::string(what) + " id is missing");
  }
  return Result::Ok();
}

} // namespace

ShipxClient::ShipxClient(shipx::transport::HttpTransportPtr transport, std::string base_url,
                         shipx::config::Credentials credentials)
    : transport_(std::move(transport)), base_url_(std::move(base_url)), credentials_(std::move(credentials)) {
}

std::string ShipxClient::ShipmentsEndpoint() const {
  return base_url_ + "/organizations/" + credentials_.organization_id + "/shipments";
}

std::string ShipxClient::ShipmentEndpoint(std::int64_t shipment_id) const {
  return base_url_ + "/shipments/" + std::to_string(shipment_id);
}

std::string ShipxClient::LabelEndpoint(std::int64_t shipment_id, const std::string& format, const std::string& type) const {
  return ShipmentEndpoint(shipment_id) + "/label?format=" + shipx::transport::EscapeQueryValue(format) +
         "&type=" + shipx::transport::EscapeQueryValue(type);
}

std::string ShipxClient::DispatchOrdersEndpoint() const {
  return base_url_ + "/organizations/" + credentials_.organization_id + "/dispatch_orders";
}

std::string ShipxClient::PrintoutEndpoint(std::int64_t dispatch_order_id, const std::string& format) const {
  return base_url_ + "/dispatch_orders/" + std::to_string(dispatch_order_id) +
         "/printout?format=" + shipx::transport::EscapeQueryValue(format);
}

Result ShipxClient::CreateShipment(const shipx::courier::v1::ShipmentRequest& request, shipx::courier::v1::ShipmentResult* result,
                                   ApiCall* call) const {
  std::string body;
  if (auto encoded = ToJson(request, &body); !encoded) {
    return encoded;
  }

  if (auto exchanged = Exchange(HttpMethod::kPost, ShipmentsEndpoint(), body, call); !exchanged) {
    return exchanged;
  }

  if (auto parsed = FromJson(call->response_body, result); !parsed) {
    call->error = parsed.message;
    return parsed;
  }
  if (auto has_id = RequireId(result->id(), "shipment"); !has_id) {
    call->error = has_id.message;
    return has_id;
  }
  return Result::Ok();
}

Result ShipxClient::GetShipment(std::int64_t shipment_id, shipx::courier::v1::ShipmentResult* result, ApiCall* call) const {
  if (auto has_id = RequireId(shipment_id, "shipment"); !has_id) {
    return has_id;
  }

  if (auto exchanged = Exchange(HttpMethod::kGet, ShipmentEndpoint(shipment_id), {}, call); !exchanged) {
    return exchanged;
  }

  if (auto parsed = FromJson(call->response_body, result); !parsed) {
    call->error = parsed.message;
    return parsed;
  }
  return Result::Ok();
}

Result ShipxClient::GetLabel(std::int64_t shipment_id, const std::string& format, const std::string& type, std::string* bytes,
                             ApiCall* call) const {
  if (auto has_id = RequireId(shipment_id, "shipment"); !has_id) {
    return has_id;
  }

  if (auto exchanged = Exchange(HttpMethod::kGet, LabelEndpoint(shipment_id, format, type), {}, call); !exchanged) {
    return exchanged;
  }

  if (auto document = RequireDocument("label", call); !document) {
    return document;
  }

  *bytes = call->response_body;
  return Result::Ok();
}

Result ShipxClient::CreateDispatchOrder(const shipx::courier::v1::DispatchOrderRequest& request,
                                        shipx::courier::v1::DispatchOrderResult* result, ApiCall* call) const {
  std::string body;
  if (auto encoded = ToJson(request, &body); !encoded) {
    return encoded;
  }

  if (auto exchanged = Exchange(HttpMethod::kPost, DispatchOrdersEndpoint(), body, call); !exchanged) {
    return exchanged;
  }

  if (auto parsed = FromJson(call->response_body, result); !parsed) {
    call->error = parsed.message;
    return parsed;
  }
  if (auto has_id = RequireId(result->id(), "dispatch order"); !has_id) {
    call->error = has_id.message;
    return has_id;
  }
  return Result::Ok();
}

Result ShipxClient::GetDispatchPrintout(std::int64_t dispatch_order_id, const std::string& format, std::string* bytes,
                                        ApiCall* call) const {
  if (auto has_id = RequireId(dispatch_order_id, "dispatch order"); !has_id) {
    return has_id;
  }

  if (auto exchanged = Exchange(HttpMethod::kGet, PrintoutEndpoint(dispatch_order_id, format), {}, call); !exchanged) {
    return exchanged;
  }

  if (auto document = RequireDocument("printout", call); !document) {
    return document;
  }

  *bytes = call->response_body;
  return Result::Ok();
}

Result ShipxClient::ToJson(const google::protobuf::Message& message, std::string* json) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, json, options);
  if (!status.ok()) {
    return Result::Err(ErrorCode::kInternal, "failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return Result::Ok();
}

Result ShipxClient::FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    return Result::Err(ErrorCode::kProtocol, "failed to decode " + message->GetTypeName() + ": " + std::string(status.message()));
  }
  return Result::Ok();
}

Result ShipxClient::Exchange(HttpMethod method, const std::string& url, const std::string& body, ApiCall* call) const {
  *call              = ApiCall{};
  call->endpoint     = url;
  call->method       = shipx::transport::ToString(method);
  call->request_body = body;

  if (!credentials_.Complete()) {
    call->error = "API token or organization ID not found";
    return Result::Err(ErrorCode::kConfiguration, call->error);
  }

  HttpRequest request;
  request.method                   = method;
  request.url                      = url;
  request.body                     = body;
  request.headers["Authorization"] = "Bearer " + credentials_.api_token;
  request.headers["Content-Type"]  = "application/json";
  request.headers["Accept"]        = "application/json";

  const HttpResponse response = transport_->Send(request);
  if (!response.Completed()) {
    call->error = response.error;
    return Result::Err(ErrorCode::kTransport, call->method + " " + url + " failed: " + response.error);
  }

  call->http_status   = response.status;
  call->content_type  = response.content_type;
  call->response_body = response.body;

  if (!response.Success()) {
    call->error = response.body.empty() ? "HTTP " + std::to_string(response.status) : response.body;
    return Result::Err(ErrorCode::kProvider,
                       call->method + " " + url + " failed with HTTP " + std::to_string(response.status) + ": " + call->error);
  }
  return Result::Ok();
}

} // namespace shipx::client
