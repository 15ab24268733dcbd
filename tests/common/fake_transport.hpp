#pragma once

#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "internal/transport/http_transport.hpp"

namespace shipx::testing {

/*
  Replays scripted responses in order and records every request. A request
  past the end of the script gets a transport error.
*/
class FakeTransport final : public shipx::transport::HttpTransport {
 public:
  FakeTransport& Reply(long status, std::string body, std::string content_type = {}) {
    shipx::transport::HttpResponse response;
    response.status       = status;
    response.body         = std::move(body);
    response.content_type = std::move(content_type);
    script_.push_back(std::move(response));
    return *this;
  }

  FakeTransport& Fail(std::string error) {
    shipx::transport::HttpResponse response;
    response.error = std::move(error);
    script_.push_back(std::move(response));
    return *this;
  }

  shipx::transport::HttpResponse Send(const shipx::transport::HttpRequest& request) override {
    requests_.push_back(request);
    if (script_.empty()) {
      shipx::transport::HttpResponse unexpected;
      unexpected.error = "unexpected request " + request.url;
      return unexpected;
    }
    auto response = std::move(script_.front());
    script_.pop_front();
    return response;
  }

  const std::vector<shipx::transport::HttpRequest>& Requests() const {
    return requests_;
  }

  std::size_t Remaining() const {
    return script_.size();
  }

 private:
  std::deque<shipx::transport::HttpResponse> script_;
  std::vector<shipx::transport::HttpRequest> requests_;
};

} // namespace shipx::testing
