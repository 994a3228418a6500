// src/core/relay_error.h
#pragma once
#include <stdint.h>

enum class RelayError : uint8_t {
  None = 0,
  InvalidRequest, // 4xx, terminal
  Credential,     // handshake failed and nothing cached
  Provider,       // synthesis call returned non-2xx (or transport failure)
  Sink,           // stream write failed
  Internal,
};

inline const char* relayErrorName(RelayError e) {
  switch (e) {
    case RelayError::None:           return "none";
    case RelayError::InvalidRequest: return "invalid_request";
    case RelayError::Credential:     return "credential";
    case RelayError::Provider:       return "provider";
    case RelayError::Sink:           return "sink";
    case RelayError::Internal:       return "internal";
  }
  return "?";
}
