// src/config/tr_config_store.h
#pragma once
#include <stdint.h>
#include <string>

// JSON 設定ファイルを一度だけ読み込み、ランタイムに反映する。
// path が空、またはファイルが無い/壊れている場合は config.h の既定値のまま。
void trConfigBegin(const std::string& path);

// CLI (--set key=value) からの key/value を検証して反映する（保存はしない）。
bool trConfigSetKV(const std::string& key, const std::string& val, std::string& err);

// 設定値をマスクした JSON を返す（--print-config 用）。
std::string trConfigGetMaskedJson();

// Back to compile-time defaults (tests).
void trConfigResetForTest();

// ---- getters ----
// API_KEY 環境変数が設定されていれば、それが api_key より優先される。
const char* trCfgApiKey();

uint32_t trCfgDefaultConcurrency();
uint32_t trCfgDefaultChunkSize();

const char* trCfgOutputFormat();
const char* trCfgUserAgent();

uint32_t trCfgHttpTimeoutMs();
uint32_t trCfgTokenTimeoutMs();
