// src/config/config_private.sample.h
// Module implementation.
#pragma once
// =========================================================
// config_private.sample.h
// Copy to config_private.h (git-ignored). Runtime config / API_KEY env still win.
// ---- Relay (secret) ----
#define TR_API_KEY "your-relay-api-key" // Authorization: Bearer <key> を要求する（空なら認証なし）
