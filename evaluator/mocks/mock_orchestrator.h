#include <gmock/gmock.h>

#include "orchestrator.h"

namespace evaluator {

class MockOrchestrator : public Orchestrator {
 public:
  MOCK_CONST_METHOD2(EvaluateSingle, SingleEvaluation(
      const EvaluationContext& context, const MetricSelection& selection));
};

} // namespace evaluator
