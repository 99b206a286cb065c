#include "basic_framework.h"

#include <map>

#include "metrics_engine.h"

namespace evaluator {
namespace frameworks {

const string BasicFramework::NAME = "basic";

BasicFramework::BasicFramework(shared_ptr<MetricsEngine> engine) :
    engine(engine) {}

FrameworkResult BasicFramework::Run(const EvaluationContext& context,
                                    const MetricSelection& selection) const {
  map<string, string> failures;
  map<string, double> scores = engine->Evaluate(context, selection, &failures);

  FrameworkResult result(NAME);
  for (const auto& score: scores) {
    auto failure = failures.find(score.first);
    if (failure == failures.end()) {
      result.SetMetric(score.first, MetricResult(score.second, true));
    } else {
      result.SetMetric(score.first,
                       MetricResult(score.second, false, failure->second));
    }
  }
  return result;
}

string BasicFramework::GetName() const {
  return NAME;
}

vector<string> BasicFramework::GetAvailableMetrics() const {
  return engine->GetAvailableMetrics();
}

bool BasicFramework::IsOffline() const {
  return true;
}

} // namespace frameworks
} // namespace evaluator
