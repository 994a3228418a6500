// src/net/http_transport.h
// Module implementation.
#pragma once
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  uint32_t timeoutMs = 20000;
  bool acceptGzip = false;
};

struct HttpResponse {
  int status = 0;      // 0: transport failure (see err)
  std::string body;
  std::string err;     // short reason, empty on success
};

// Outbound POST seam. Implementations must be callable from many threads at once.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse post(const HttpRequest& req) = 0;
};

// libcurl: one easy handle per call.
class CurlHttpTransport : public HttpTransport {
public:
  CurlHttpTransport();
  HttpResponse post(const HttpRequest& req) override;
};
