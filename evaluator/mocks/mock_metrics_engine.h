#include <gmock/gmock.h>

#include "metrics_engine.h"

namespace evaluator {

class MockMetricsEngine : public MetricsEngine {
 public:
  MOCK_CONST_METHOD3(Evaluate, map<string, double>(
      const EvaluationContext& context, const MetricSelection& selection,
      map<string, string>* failures));
  MOCK_CONST_METHOD0(GetAvailableMetrics, vector<string>());
};

} // namespace evaluator
