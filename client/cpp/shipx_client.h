#pragma once

#include <google/protobuf/message.h>

#include <cstdint>
#include <memory>
#include <string>

#include "api/shipx/courier/v1.hpp"
#include "internal/config/credentials.hpp"
#include "internal/transport/http_transport.hpp"
#include "internal/util/result.hpp"

namespace shipx::client {

/*
  What went over the wire for one API call. Filled on success and failure so
  the caller can log the endpoint, payload and provider answer.
*/
struct ApiCall {
  std::string endpoint;
  std::string method;
  std::string request_body;
  long        http_status = 0;
  std::string content_type;
  std::string response_body;
  // Provider error body, transport message, or parse error. Empty on success.
  std::string error;
};

/*
  ShipX REST client.

  Builds endpoint URLs from the base URL and organization id, attaches the
  bearer token and JSON headers to every request and maps HTTP outcomes onto
  util::Result:

    transport did not complete → kTransport
    non-2xx status             → kProvider
    2xx body unusable          → kProtocol
    credentials missing        → kConfiguration (transport never called)
*/
class ShipxClient {
 public:
  ShipxClient(shipx::transport::HttpTransportPtr transport, std::string base_url,
              shipx::config::Credentials credentials);

  std::string ShipmentsEndpoint() const;
  std::string ShipmentEndpoint(std::int64_t shipment_id) const;
  std::string LabelEndpoint(std::int64_t shipment_id, const std::string& format, const std::string& type) const;
  std::string DispatchOrdersEndpoint() const;
  std::string PrintoutEndpoint(std::int64_t dispatch_order_id, const std::string& format) const;

  shipx::util::Result CreateShipment(const shipx::courier::v1::ShipmentRequest& request, shipx::courier::v1::ShipmentResult* result,
                                     ApiCall* call) const;

  shipx::util::Result GetShipment(std::int64_t shipment_id, shipx::courier::v1::ShipmentResult* result, ApiCall* call) const;

  shipx::util::Result GetLabel(std::int64_t shipment_id, const std::string& format, const std::string& type, std::string* bytes,
                               ApiCall* call) const;

  shipx::util::Result CreateDispatchOrder(const shipx::courier::v1::DispatchOrderRequest& request,
                                          shipx::courier::v1::DispatchOrderResult* result, ApiCall* call) const;

  shipx::util::Result GetDispatchPrintout(std::int64_t dispatch_order_id, const std::string& format, std::string* bytes,
                                          ApiCall* call) const;

  // snake_case JSON as the provider expects it.
  static shipx::util::Result ToJson(const google::protobuf::Message& message, std::string* json);
  // Unknown fields in provider responses are ignored.
  static shipx::util::Result FromJson(const std::string& json, google::protobuf::Message* message);

 private:
  shipx::util::Result Exchange(shipx::transport::HttpMethod method, const std::string& url, const std::string& body,
                               ApiCall* call) const;

  shipx::transport::HttpTransportPtr transport_;
  std::string                        base_url_;
  shipx::config::Credentials         credentials_;
};

} // namespace shipx::client
