// src/utils/logging.h
// Module implementation.
#pragma once
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>

#include "utils/tr_log_limiter.h"
// ================================
// One line per call, stderr. Serialized (synthesis threads log concurrently).
// ================================
void trLogf(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;
// Monotonic milliseconds (log limiter / timing).
uint32_t trMillis();
// ================================
//   0: QUIET, 1: NORMAL, 2: DIAG, 3: TRACE
// ================================
#ifndef TR_LOG_LEVEL
#define TR_LOG_LEVEL 1
#endif
#if (TR_LOG_LEVEL < 0) || (TR_LOG_LEVEL > 3)
#error "TR_LOG_LEVEL must be 0..3"
#endif
// ================================
// ================================
#define TR__LOG(prefix, tag, fmt, ...) \
  trLogf(prefix " " tag " " fmt, ##__VA_ARGS__)
// Always on (errors)
#define TR_LOGE(tag, fmt, ...) TR__LOG("[E]", tag, fmt, ##__VA_ARGS__)
// L1+
#if (TR_LOG_LEVEL >= 1)
  #define TR_LOGW(tag, fmt, ...) TR__LOG("[W]", tag, fmt, ##__VA_ARGS__)
  #define TR_LOGI(tag, fmt, ...) TR__LOG("[I]", tag, fmt, ##__VA_ARGS__)
#else
  #define TR_LOGW(tag, fmt, ...) do {} while (0)
  #define TR_LOGI(tag, fmt, ...) do {} while (0)
#endif
// L2+
#if (TR_LOG_LEVEL >= 2)
  #define TR_LOGD(tag, fmt, ...) TR__LOG("[D]", tag, fmt, ##__VA_ARGS__)
#else
  #define TR_LOGD(tag, fmt, ...) do {} while (0)
#endif
// L3 only
#if (TR_LOG_LEVEL >= 3)
  #define TR_LOGT(tag, fmt, ...) TR__LOG("[T]", tag, fmt, ##__VA_ARGS__)
#else
  #define TR_LOGT(tag, fmt, ...) do {} while (0)
#endif
// ================================
// pipeline events (request / window / credential timeline)
// ================================
#define TR_EVT(tag, fmt, ...) \
  trLogf("[EVT] " tag " " fmt, ##__VA_ARGS__)
#if (TR_LOG_LEVEL >= 2)
  #define TR_EVT_D(tag, fmt, ...) \
    trLogf("[EVT] " tag " " fmt, ##__VA_ARGS__)
#else
  #define TR_EVT_D(tag, fmt, ...) do {} while (0)
#endif
// ================================
// rate-limited INFO (same key within windowMs is suppressed)
// ================================
#if (TR_LOG_LEVEL >= 1)
  #define TR_LOGI_RL(key, windowMs, tag, fmt, ...)                                        \
    do {                                                                                  \
      uint32_t _tr_sup = 0;                                                               \
      uint32_t _tr_now = trMillis();                                                      \
      if (tr_log_limiter::shouldLog((key), (windowMs), _tr_now, &_tr_sup)) {              \
        if (_tr_sup > 0) {                                                                \
          trLogf("[I] " tag " suppressed %lu", (unsigned long)_tr_sup);                   \
        }                                                                                 \
        trLogf("[I] " tag " " fmt, ##__VA_ARGS__);                                        \
      }                                                                                   \
    } while (0)
#else
  #define TR_LOGI_RL(key, windowMs, tag, fmt, ...) do {} while (0)
#endif
