#pragma once

#include <map>
#include <memory>
#include <string>

namespace shipx::transport {

enum class HttpMethod {
  kGet,
  kPost,
};

inline const char* ToString(HttpMethod method) {
  return method == HttpMethod::kPost ? "POST" : "GET";
}

struct HttpRequest {
  HttpMethod                         method = HttpMethod::kGet;
  std::string                        url;
  std::string                        body;
  std::map<std::string, std::string> headers;
};

/*
  `error` is set when the exchange did not complete (DNS, connect, TLS,
  timeout). A completed exchange always has `status` and `body`, whatever the
  status code.
*/
struct HttpResponse {
  long        status = 0;
  std::string body;
  std::string content_type;
  std::string error;

  bool Completed() const {
    return error.empty();
  }

  bool Success() const {
    return Completed() && status >= 200 && status < 300;
  }
};

/*
  Synchronous HTTP exchange.

  Implementations:
    CurlTransport → libcurl easy handle
    tests         → scripted responses
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Send(const HttpRequest& request) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

} // namespace shipx::transport
