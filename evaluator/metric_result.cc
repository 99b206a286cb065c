#include "metric_result.h"

#include <algorithm>
#include <stdexcept>

namespace evaluator {

MetricResult::MetricResult() : success(false) {}

MetricResult::MetricResult(double score, bool success,
                           const boost::optional<string>& reason) :
    score(max(0.0, min(1.0, score))), success(success), reason(reason) {}

MetricResult MetricResult::Missing(const string& reason) {
  MetricResult result;
  result.reason = reason;
  return result;
}

bool MetricResult::operator==(const MetricResult& other) const {
  return score == other.score && success == other.success &&
         reason == other.reason;
}

FrameworkResult::FrameworkResult(const string& framework_name) :
    framework_name(framework_name) {}

FrameworkResult FrameworkResult::Error(const string& framework_name,
                                       const string& message) {
  FrameworkResult result(framework_name);
  result.error = message;
  return result;
}

const string& FrameworkResult::GetError() const {
  if (!error) {
    throw logic_error("framework " + framework_name + " did not fail");
  }
  return *error;
}

void FrameworkResult::SetMetric(const string& metric_name,
                                const MetricResult& result) {
  metrics[metric_name] = result;
}

bool FrameworkResult::HasMetric(const string& metric_name) const {
  return metrics.count(metric_name);
}

const MetricResult& FrameworkResult::GetMetric(
    const string& metric_name) const {
  auto it = metrics.find(metric_name);
  if (it == metrics.end()) {
    throw out_of_range("framework " + framework_name + " has no metric " +
                       metric_name);
  }
  return it->second;
}

size_t AggregatedResult::NumErrors() const {
  size_t num_errors = 0;
  for (const auto& entry: framework_scores) {
    if (entry.second.IsError()) {
      ++num_errors;
    }
  }
  return num_errors;
}

vector<double> AggregatedResult::GetNumericScores() const {
  vector<double> scores;
  for (const auto& entry: automatic_metrics) {
    if (entry.second.score) {
      scores.push_back(*entry.second.score);
    }
  }
  for (const auto& framework: framework_scores) {
    if (framework.second.IsError()) {
      continue;
    }
    for (const auto& entry: framework.second.GetMetrics()) {
      if (entry.second.score) {
        scores.push_back(*entry.second.score);
      }
    }
  }
  return scores;
}

} // namespace evaluator
