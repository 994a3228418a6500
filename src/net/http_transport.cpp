// src/net/http_transport.cpp
// Module implementation.
#include "net/http_transport.h"

#include <curl/curl.h>
#include <mutex>

#include "utils/logging.h"

namespace {

static std::once_flag s_curlInitOnce;

static void curlGlobalInit_() {
  std::call_once(s_curlInitOnce, []() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      TR_LOGE("HTTP", "curl_global_init failed rc=%d", (int)rc);
    }
  });
}

static size_t writeBody_(char* ptr, size_t size, size_t nmemb, void* userdata) {
  std::string* out = static_cast<std::string*>(userdata);
  const size_t n = size * nmemb;
  out->append(ptr, n);
  return n;
}

// RAII for one easy handle + its header list
struct CurlCall {
  CURL* h = nullptr;
  curl_slist* hdrs = nullptr;
  CurlCall() : h(curl_easy_init()) {}
  ~CurlCall() {
    if (hdrs) curl_slist_free_all(hdrs);
    if (h) curl_easy_cleanup(h);
  }
  CurlCall(const CurlCall&) = delete;
  CurlCall& operator=(const CurlCall&) = delete;
};

} // namespace

CurlHttpTransport::CurlHttpTransport() { curlGlobalInit_(); }

HttpResponse CurlHttpTransport::post(const HttpRequest& req) {
  HttpResponse res;

  CurlCall c;
  if (!c.h) {
    res.err = "curl_init";
    TR_LOGE("HTTP", "curl_easy_init failed");
    return res;
  }

  for (const auto& kv : req.headers) {
    const std::string line = kv.first + ": " + kv.second;
    curl_slist* next = curl_slist_append(c.hdrs, line.c_str());
    if (!next) {
      res.err = "curl_headers";
      return res;
    }
    c.hdrs = next;
  }

  curl_easy_setopt(c.h, CURLOPT_URL, req.url.c_str());
  curl_easy_setopt(c.h, CURLOPT_POST, 1L);
  curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, req.body.c_str());
  curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)req.body.size());
  curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.hdrs);
  curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, (long)req.timeoutMs);
  curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L); // worker threads
  curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, &writeBody_);
  curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &res.body);
  // gzip is negotiated by curl itself so the body arrives decoded
  if (req.acceptGzip) curl_easy_setopt(c.h, CURLOPT_ACCEPT_ENCODING, "gzip");

  const uint32_t t0 = trMillis();
  const CURLcode rc = curl_easy_perform(c.h);
  if (rc != CURLE_OK) {
    res.status = 0;
    res.body.clear();
    res.err = curl_easy_strerror(rc);
    TR_LOGI_RL("HTTP.fail", 5000, "HTTP", "transport fail rc=%d (%s) took=%ums",
               (int)rc, res.err.c_str(), (unsigned)(trMillis() - t0));
    return res;
  }

  long code = 0;
  curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &code);
  res.status = (int)code;
  TR_LOGT("HTTP", "POST status=%d bytes=%u took=%ums",
          res.status, (unsigned)res.body.size(), (unsigned)(trMillis() - t0));
  return res;
}
