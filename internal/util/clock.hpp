#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace provenance::util {

/*
  Ledger clock: a monotonically increasing block height.

  The ledger reads it once per call and stamps every write of that
  call with the same value.
*/
class Clock {
 public:
  virtual ~Clock() = default;

  virtual uint64_t Height() = 0;
};

// Seconds since the unix epoch, never moving backwards and never below floor.
class SystemClock final : public Clock {
 public:
  explicit SystemClock(uint64_t floor = 0) : last_(floor) {
  }

  uint64_t Height() override;

 private:
  std::atomic<uint64_t> last_;
};

// Caller-driven height for tests and replay.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t height = 1) : height_(height) {
  }

  uint64_t Height() override {
    return height_.load();
  }

  void Advance(uint64_t blocks = 1) {
    height_ += blocks;
  }

  void Set(uint64_t height) {
    height_ = height;
  }

 private:
  std::atomic<uint64_t> height_;
};

} // namespace provenance::util
