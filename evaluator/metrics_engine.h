#ifndef _METRICS_ENGINE_H_
#define _METRICS_ENGINE_H_

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "evaluation_context.h"

using namespace std;

namespace evaluator {

/**
 * Runs the reference-free and reference-based text similarity metrics on an
 * evaluation context.
 *
 * Metrics comparing the answer with the expected answer are skipped when the
 * context has no expected answer. A metric whose computation throws is scored
 * 0 and the failure is logged; the remaining metrics are still computed.
 */
class MetricsEngine {
 public:
  typedef function<double(const EvaluationContext&)> MetricFunction;

  MetricsEngine();

  virtual ~MetricsEngine();

  // Computes the selected metrics (every metric if the selection is empty).
  // Unknown metric names are ignored. If failures is not null, it receives
  // the error message of every metric that could not be computed.
  virtual map<string, double> Evaluate(
      const EvaluationContext& context,
      const MetricSelection& selection = MetricSelection(),
      map<string, string>* failures = NULL) const;

  // Returns the metric names in catalog order.
  virtual vector<string> GetAvailableMetrics() const;

  // Returns true if the metric compares against the expected answer.
  bool RequiresReference(const string& metric_name) const;

 protected:
  struct Metric {
    string name;
    bool requires_reference;
    MetricFunction function;
  };

  // For testing only.
  MetricsEngine(const vector<Metric>& catalog);

 private:
  const Metric* FindMetric(const string& metric_name) const;

  vector<Metric> catalog;
};

} // namespace evaluator

#endif
