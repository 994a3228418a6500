// src/core/audio_sink.h
// Module implementation.
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <string>

// Incremental audio consumer for streamed delivery.
// Contract:
// - write() in chunk order; false means the consumer is gone (terminal)
// - error() at most once, before close(), when the stream is being truncated
// - close() exactly once on every exit path
class AudioSink {
public:
  virtual ~AudioSink() = default;
  virtual bool write(const uint8_t* data, size_t len) = 0;
  virtual void error(const std::string& cause) = 0;
  virtual void close() = 0;
};

// FILE*-backed sink ("-" = stdout). Flushes after every write.
class FileAudioSink : public AudioSink {
public:
  FileAudioSink() = default;
  ~FileAudioSink() override;

  FileAudioSink(const FileAudioSink&) = delete;
  FileAudioSink& operator=(const FileAudioSink&) = delete;

  bool open(const std::string& path);
  bool isOpen() const { return fp_ != nullptr; }

  bool write(const uint8_t* data, size_t len) override;
  void error(const std::string& cause) override;
  void close() override;

  size_t bytesWritten() const { return written_; }
  bool failed() const { return failed_; }

private:
  FILE* fp_ = nullptr;
  bool owned_ = false;
  bool failed_ = false;
  size_t written_ = 0;
};
