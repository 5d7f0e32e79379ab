#include "clock.hpp"

namespace provenance::util {

uint64_t SystemClock::Height() {
  const auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());

  uint64_t last = last_.load();
  while (now > last && !last_.compare_exchange_weak(last, now)) {
  }
  return now > last ? now : last;
}

} // namespace provenance::util
