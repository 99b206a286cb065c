#ifndef _BASIC_FRAMEWORK_H_
#define _BASIC_FRAMEWORK_H_

#include <memory>
#include <string>
#include <vector>

#include "framework.h"

using namespace std;

namespace evaluator {

class MetricsEngine;

namespace frameworks {

/**
 * Framework wrapping the built-in metrics engine.
 */
class BasicFramework : public Framework {
 public:
  BasicFramework(shared_ptr<MetricsEngine> engine);

  FrameworkResult Run(const EvaluationContext& context,
                      const MetricSelection& selection) const;

  string GetName() const;

  vector<string> GetAvailableMetrics() const;

  bool IsOffline() const;

  static const string NAME;

 private:
  shared_ptr<MetricsEngine> engine;
};

} // namespace frameworks
} // namespace evaluator

#endif
