// src/utils/tr_log_limiter.h
// Module implementation.
// Per-key rate limit for TR_LOGI_RL.
//
// The first line for a key always prints. Further lines inside windowMs are counted
// and dropped; the next line after the window reports that count once.
//
// Thread safety: every call takes one process-wide mutex, so synthesis workers and the
// request thread may share keys. Keys are compared by content but stored by pointer,
// so they must outlive the process (string literals).
#pragma once
#include <stdint.h>
namespace tr_log_limiter {
// true -> print now. *out_suppressed is the number of dropped lines to report first
// (0 when nothing was dropped). A null or empty key is never limited.
bool shouldLog(const char* key, uint32_t windowMs, uint32_t nowMs, uint32_t* out_suppressed);
// Forget every key (tests).
void resetAll();
} // namespace tr_log_limiter
