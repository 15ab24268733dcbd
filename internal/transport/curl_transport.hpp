#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "internal/transport/http_transport.hpp"

namespace shipx::transport {

/*
  Process-wide libcurl init/cleanup. Construct once in main before any
  transport and keep it alive until every transport is gone.
*/
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&)            = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/*
  Percent-encodes a query parameter value with curl_easy_escape. Everything
  but ALPHA, DIGIT and -._~ is escaped.
*/
std::string EscapeQueryValue(std::string_view value);

struct CurlOptions {
  std::chrono::milliseconds timeout{30000};
  bool                      verify_tls = false;
  std::string               user_agent;
};

/*
  HttpTransport over a libcurl easy handle.

  A fresh handle is used per request; the workflow issues a handful of calls
  so connection reuse is not worth the shared state.
*/
class CurlTransport final : public HttpTransport {
 public:
  explicit CurlTransport(CurlOptions options);

  HttpResponse Send(const HttpRequest& request) override;

 private:
  CurlOptions options_;
};

} // namespace shipx::transport
