#include <gmock/gmock.h>

#include "frameworks/framework.h"

namespace evaluator {
namespace frameworks {

class MockFramework : public Framework {
 public:
  MOCK_CONST_METHOD2(Run, FrameworkResult(const EvaluationContext& context,
                                          const MetricSelection& selection));
  MOCK_CONST_METHOD0(GetName, string());
  MOCK_CONST_METHOD0(GetAvailableMetrics, vector<string>());
  MOCK_CONST_METHOD0(IsOffline, bool());
};

} // namespace frameworks
} // namespace evaluator
