#pragma once

#include <stddef.h>
#include <stdint.h>

namespace fmtuner {

// Two-wire transactions against the tuner at a fixed 7-bit address.
// Both calls move the whole frame or report failure; there are no partial transfers.
class BusTransport {
 public:
  virtual ~BusTransport() = default;
  virtual bool write(const uint8_t* data, size_t length) = 0;
  virtual bool read(uint8_t* data, size_t length) = 0;
};

// Byte-blob key-value store with Preferences-like semantics.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;
  // 0 when the key is absent.
  virtual size_t getBytesLength(const char* key) = 0;
  virtual size_t getBytes(const char* key, void* buffer, size_t length) = 0;
  // Bytes written; anything short of length is a failed write.
  virtual size_t putBytes(const char* key, const void* data, size_t length) = 0;
  virtual bool remove(const char* key) = 0;
};

class Clock {
 public:
  virtual ~Clock() = default;
  virtual void delayMs(uint32_t ms) = 0;
};

// Called once per status poll while a search is running.
class SeekObserver {
 public:
  virtual ~SeekObserver() = default;
  virtual void onSeekPoll(uint16_t frequency10Khz, uint8_t pollIndex) = 0;
};

}  // namespace fmtuner
