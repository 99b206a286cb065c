#ifndef _FRAMEWORK_H_
#define _FRAMEWORK_H_

#include <string>
#include <vector>

#include "evaluation_context.h"
#include "metric_result.h"

using namespace std;

namespace evaluator {
namespace frameworks {

/**
 * Base class for the scoring backends the orchestrator dispatches to.
 *
 * Run() may be called concurrently from several threads, must not modify the
 * context and should report failures through FrameworkResult::Error rather
 * than by throwing. Implementations talking to remote services are
 * responsible for bounding the time spent in Run().
 */
class Framework {
 public:
  virtual ~Framework();

  virtual FrameworkResult Run(const EvaluationContext& context,
                              const MetricSelection& selection) const = 0;

  virtual string GetName() const = 0;

  virtual vector<string> GetAvailableMetrics() const = 0;

  // Returns true if the framework scores without ground truth gating or
  // remote services. Its results are merged into the automatic metrics.
  virtual bool IsOffline() const;
};

} // namespace frameworks
} // namespace evaluator

#endif
