#include "verbosity.h"

#include <atomic>

namespace evaluator {

namespace {
std::atomic<bool> verbose_output(true);
} // namespace

void SetVerbose(bool verbose) {
  verbose_output = verbose;
}

bool IsVerbose() {
  return verbose_output;
}

} // namespace evaluator
