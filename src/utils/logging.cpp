// src/utils/logging.cpp
// Module implementation.
#include "utils/logging.h"

#include <chrono>
#include <mutex>

static std::mutex g_logMu;

void trLogf(const char* fmt, ...) {
  char buf[512];
  va_list ap;
  va_start(ap, fmt);
  vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  std::lock_guard<std::mutex> lock(g_logMu);
  fputs(buf, stderr);
  fputc('\n', stderr);
}

uint32_t trMillis() {
  static const auto t0 = std::chrono::steady_clock::now();
  const auto d = std::chrono::steady_clock::now() - t0;
  return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}
