// src/config/config.h
// Module implementation.
#pragma once

// =========================================================
// config.h
// =========================================================
#if __has_include("user_config.h")
  #include "user_config.h"
#endif
#if !defined(TR_DISABLE_CONFIG_PRIVATE)
  #if __has_include("config_private.h")
    #include "config_private.h"
  #endif
#endif
// ---------------------------------------------------------
// User-tunable defaults (override in user_config.h or the runtime JSON config)
#ifndef TR_DEFAULT_CONCURRENCY
  #define TR_DEFAULT_CONCURRENCY 10 // batch_orchestrator: chunks dispatched together per window
#endif
#ifndef TR_MAX_CONCURRENCY
  #define TR_MAX_CONCURRENCY 64 // tr_config_store / speech_request: upper bound for concurrency
#endif
#ifndef TR_DEFAULT_CHUNK_SIZE
  #define TR_DEFAULT_CHUNK_SIZE 300 // text_chunker: max code points per chunk
#endif
#ifndef TR_MAX_CHUNK_SIZE
  #define TR_MAX_CHUNK_SIZE 5000 // tr_config_store / speech_request: upper bound for chunk_size
#endif
#ifndef TR_OUTPUT_FORMAT
  #define TR_OUTPUT_FORMAT "audio-24khz-48kbitrate-mono-mp3" // edge_tts: X-Microsoft-OutputFormat
#endif
#ifndef TR_USER_AGENT
  #define TR_USER_AGENT "okhttp/4.5.0" // edge_auth / edge_tts: User-Agent header
#endif
#ifndef TR_API_KEY
  #define TR_API_KEY "" // relay_handler: empty -> no bearer check
#endif
// ---------------------------------------------------------
// Core defaults (generally not user-tuned)
#ifndef TR_HTTP_TIMEOUT_MS
  #define TR_HTTP_TIMEOUT_MS 20000 // edge_tts: synthesis request timeout
#endif
#ifndef TR_TOKEN_TIMEOUT_MS
  #define TR_TOKEN_TIMEOUT_MS 6000 // edge_auth: handshake timeout
#endif
#ifndef TR_TOKEN_REFRESH_SKEW_SEC
  #define TR_TOKEN_REFRESH_SKEW_SEC (5 * 60) // edge_auth: refresh this long before exp
#endif
#ifndef TR_PROVIDER_ERR_BODY_MAX
  #define TR_PROVIDER_ERR_BODY_MAX 1024 // edge_tts: provider error body carried to the caller
#endif
#ifndef TR_PITCH_MIN
  #define TR_PITCH_MIN 0.5 // speech_request: pitch factor clamp (-50%)
#endif
#ifndef TR_PITCH_MAX
  #define TR_PITCH_MAX 1.5 // speech_request: pitch factor clamp (+50%)
#endif
#ifndef TR_DEFAULT_STYLE
  #define TR_DEFAULT_STYLE "general" // speech_request: mstts:express-as style
#endif
// ---------------------------------------------------------
// Log head limits (bytes, UTF-8 safe)
#ifndef TR_LOG_HEAD_BYTES_PROVIDER_BODY
  #define TR_LOG_HEAD_BYTES_PROVIDER_BODY 160 // edge_tts: provider error body in logs
#endif
#ifndef TR_LOG_HEAD_BYTES_TOKEN_ERR
  #define TR_LOG_HEAD_BYTES_TOKEN_ERR 96 // edge_auth: handshake error body head
#endif
