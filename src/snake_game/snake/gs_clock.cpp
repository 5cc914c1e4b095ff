#include "gs_clock.hpp"

namespace gsnake {

RepeatingClock::RepeatingClock(int period_ms) noexcept
    : period_ms_(period_ms > 0 ? period_ms : 1) {}

bool RepeatingClock::tick(int elapsed_ms) noexcept {
  if (elapsed_ms > 0) {
    long long total = static_cast<long long>(accumulated_ms_) + elapsed_ms;
    if (total < period_ms_) {
      accumulated_ms_ = static_cast<int>(total);
      return false;
    }
    accumulated_ms_ = static_cast<int>(total % period_ms_);
    return true;
  }
  return false;
}

}  // namespace gsnake
