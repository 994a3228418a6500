// src/utils/tr_log_limiter.cpp
// Module implementation.
#include "utils/tr_log_limiter.h"

#include <mutex>
#include <string.h>

namespace tr_log_limiter {
namespace {

// The relay's TR_LOGI_RL keys (auth, reject, HTTP and TTS failures) fit with room to
// spare; an overflowing key takes over slot 0.
constexpr uint8_t kSlots = 8;

struct Slot {
  const char* key_ = nullptr;
  bool seen_ = false;
  uint32_t lastMs_ = 0;
  uint32_t dropped_ = 0;
};

Slot g_slots[kSlots];
std::mutex g_mu;

Slot* slotFor_(const char* key) {
  Slot* free = nullptr;
  for (Slot& s : g_slots) {
    if (s.key_ && strcmp(s.key_, key) == 0) return &s;
    if (!s.key_ && !free) free = &s;
  }
  Slot* s = free ? free : &g_slots[0];
  *s = Slot{};
  s->key_ = key;
  return s;
}

} // namespace

bool shouldLog(const char* key, uint32_t windowMs, uint32_t nowMs, uint32_t* out_suppressed) {
  if (out_suppressed) *out_suppressed = 0;
  if (!key || !*key) return true;

  std::lock_guard<std::mutex> lock(g_mu);
  Slot* s = slotFor_(key);
  if (!s->seen_) {
    s->seen_ = true;
    s->lastMs_ = nowMs;
    return true;
  }
  if (nowMs - s->lastMs_ < windowMs) { // unsigned: survives trMillis() wrap
    s->dropped_++;
    return false;
  }
  if (out_suppressed) *out_suppressed = s->dropped_;
  s->dropped_ = 0;
  s->lastMs_ = nowMs;
  return true;
}

void resetAll() {
  std::lock_guard<std::mutex> lock(g_mu);
  for (Slot& s : g_slots) s = Slot{};
}

} // namespace tr_log_limiter
