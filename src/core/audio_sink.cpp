// src/core/audio_sink.cpp
// Module implementation.
#include "core/audio_sink.h"

#include "utils/logging.h"

FileAudioSink::~FileAudioSink() { close(); }

bool FileAudioSink::open(const std::string& path) {
  close();
  failed_ = false;
  written_ = 0;
  if (path == "-") {
    fp_ = stdout;
    owned_ = false;
    return true;
  }
  fp_ = fopen(path.c_str(), "wb");
  owned_ = (fp_ != nullptr);
  if (!fp_) TR_LOGE("SINK", "open failed path=%s", path.c_str());
  return fp_ != nullptr;
}

bool FileAudioSink::write(const uint8_t* data, size_t len) {
  if (!fp_ || failed_) return false;
  if (len == 0) return true;
  const size_t n = fwrite(data, 1, len, fp_);
  if (n != len || fflush(fp_) != 0) {
    failed_ = true;
    TR_LOGE("SINK", "write failed wrote=%u/%u", (unsigned)n, (unsigned)len);
    return false;
  }
  written_ += n;
  return true;
}

void FileAudioSink::error(const std::string& cause) {
  failed_ = true;
  TR_LOGW("SINK", "stream truncated after %u bytes: %s", (unsigned)written_, cause.c_str());
}

void FileAudioSink::close() {
  if (!fp_) return;
  if (owned_) {
    if (fclose(fp_) != 0) TR_LOGW("SINK", "fclose failed");
  } else {
    fflush(fp_);
  }
  fp_ = nullptr;
  owned_ = false;
}
