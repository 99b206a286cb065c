#ifndef _METRIC_RESULT_H_
#define _METRIC_RESULT_H_

#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

using namespace std;

namespace evaluator {

/**
 * Uniform score record produced by every framework. The score, when present,
 * always lies in [0, 1].
 */
struct MetricResult {
  MetricResult();

  // Clamps the score into [0, 1].
  MetricResult(double score, bool success,
               const boost::optional<string>& reason = boost::none);

  // Creates a result without a score (e.g. a metric the backend could not
  // compute).
  static MetricResult Missing(const string& reason);

  bool operator==(const MetricResult& other) const;

  boost::optional<double> score;
  bool success;
  boost::optional<string> reason;
};

/**
 * Output of one framework for one evaluation context. Either holds the
 * metric results or, when the whole framework failed, an error message.
 */
class FrameworkResult {
 public:
  explicit FrameworkResult(const string& framework_name);

  static FrameworkResult Error(const string& framework_name,
                               const string& message);

  const string& GetFrameworkName() const { return framework_name; }

  bool IsError() const { return static_cast<bool>(error); }

  const string& GetError() const;

  // Adds or replaces the result of the given metric.
  void SetMetric(const string& metric_name, const MetricResult& result);

  bool HasMetric(const string& metric_name) const;

  const MetricResult& GetMetric(const string& metric_name) const;

  const map<string, MetricResult>& GetMetrics() const { return metrics; }

  size_t size() const { return metrics.size(); }

 private:
  string framework_name;
  map<string, MetricResult> metrics;
  boost::optional<string> error;
};

/**
 * Merged outputs of all the frameworks for one evaluation context.
 */
struct AggregatedResult {
  // Results of the frameworks that work offline, flattened by metric name.
  map<string, MetricResult> automatic_metrics;
  // Results of every framework, keyed by framework name.
  map<string, FrameworkResult> framework_scores;

  // Returns the number of frameworks that reported an error.
  size_t NumErrors() const;

  // Collects every numeric score: first the automatic metrics, then the
  // metrics of every framework that did not fail.
  vector<double> GetNumericScores() const;
};

} // namespace evaluator

#endif
