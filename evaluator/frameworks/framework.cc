#include "framework.h"

namespace evaluator {
namespace frameworks {

Framework::~Framework() {}

bool Framework::IsOffline() const {
  return false;
}

} // namespace frameworks
} // namespace evaluator
