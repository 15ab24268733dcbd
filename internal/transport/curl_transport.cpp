#include "internal/transport/curl_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace shipx::transport {

namespace {

size_t AppendBody(char* data, size_t size, size_t nmemb, void* user) {
  auto* body = static_cast<std::string*>(user);
  body->append(data, size * nmemb);
  return size * nmemb;
}

struct EasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlStringDeleter {
  void operator()(char* text) const {
    curl_free(text);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

} // namespace

std::string EscapeQueryValue(std::string_view value) {
  // the handle argument has been unused since curl 7.82
  std::unique_ptr<char, CurlStringDeleter> escaped(curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size())));
  if (!escaped) {
    throw std::runtime_error("curl_easy_escape failed");
  }
  return escaped.get();
}

CurlGlobal::CurlGlobal() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

CurlGlobal::~CurlGlobal() {
  curl_global_cleanup();
}

CurlTransport::CurlTransport(CurlOptions options) : options_(std::move(options)) {
}

HttpResponse CurlTransport::Send(const HttpRequest& request) {
  HttpResponse response;

  EasyHandle handle(curl_easy_init());
  if (!handle) {
    response.error = "curl_easy_init failed";
    return response;
  }

  curl_slist* raw_headers = nullptr;
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    curl_slist*       next = curl_slist_append(raw_headers, line.c_str());
    if (next == nullptr) {
      curl_slist_free_all(raw_headers);
      response.error = "curl_slist_append failed";
      return response;
    }
    raw_headers = next;
  }
  HeaderList headers(raw_headers);

  CURL* easy = handle.get();
  curl_easy_setopt(easy, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &AppendBody);
  curl_easy_setopt(easy, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
  curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
  curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
  if (!options_.user_agent.empty()) {
    curl_easy_setopt(easy, CURLOPT_USERAGENT, options_.user_agent.c_str());
  }

  if (request.method == HttpMethod::kPost) {
    curl_easy_setopt(easy, CURLOPT_POST, 1L);
    curl_easy_setopt(easy, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  } else {
    curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
  }

  char error_buffer[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, error_buffer);

  const CURLcode code = curl_easy_perform(easy);
  if (code != CURLE_OK) {
    response.error = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(code));
    response.body.clear();
    return response;
  }

  curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &response.status);

  char* content_type = nullptr;
  if (curl_easy_getinfo(easy, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type != nullptr) {
    response.content_type = content_type;
  }

  return response;
}

} // namespace shipx::transport
