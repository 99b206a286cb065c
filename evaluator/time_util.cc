#include "time_util.h"

namespace evaluator {

double GetDuration(const Clock::time_point& start_time,
                   const Clock::time_point& stop_time) {
  return duration_cast<microseconds>(stop_time - start_time).count() / 1e6;
}

} // namespace evaluator
