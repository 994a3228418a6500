// src/config/user_config.h
// Module implementation.
#pragma once
// =========================================================
// user_config.h
// ---- Batching ----
#define TR_DEFAULT_CONCURRENCY 10 // 1ウィンドウで同時に投げるチャンク数（リクエストの concurrency で上書き可）
#define TR_DEFAULT_CHUNK_SIZE 300 // 1チャンクの最大文字数（コードポイント）
// ---- Provider ----
#define TR_OUTPUT_FORMAT "audio-24khz-48kbitrate-mono-mp3" // X-Microsoft-OutputFormat
// ---- Style ----
#define TR_DEFAULT_STYLE "general" // mstts:express-as の既定スタイル
