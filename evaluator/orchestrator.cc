#include "orchestrator.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "framework_registry.h"
#include "frameworks/framework.h"
#include "time_util.h"
#include "verbosity.h"

namespace evaluator {

const size_t Orchestrator::DEFAULT_BATCH_SIZE = 10;

string GetStatusName(EvaluationStatus status) {
  return status == COMPLETED ? "completed" : "failed";
}

Orchestrator::Orchestrator(shared_ptr<FrameworkRegistry> registry,
                           int max_threads) :
    registry(registry), max_threads(max_threads) {}

Orchestrator::Orchestrator() : max_threads(0) {}

Orchestrator::~Orchestrator() {}

SingleEvaluation Orchestrator::EvaluateSingle(
    const EvaluationContext& context, const MetricSelection& selection) const {
  context.Validate();

  Clock::time_point start_time = Clock::now();
  const vector<shared_ptr<frameworks::Framework> >& frameworks =
      registry->GetFrameworks();
  vector<FrameworkResult> results;
  for (auto framework: frameworks) {
    results.push_back(FrameworkResult(framework->GetName()));
  }

  #pragma omp parallel for schedule(dynamic) \
      num_threads(GetNumThreads(frameworks.size()))
  for (size_t i = 0; i < frameworks.size(); ++i) {
    results[i] = Dispatch(*frameworks[i], context, selection);
  }

  SingleEvaluation evaluation;
  for (size_t i = 0; i < frameworks.size(); ++i) {
    const FrameworkResult& result = results[i];
    if (result.IsError()) {
      cerr << "Framework " << frameworks[i]->GetName() << " failed: "
           << result.GetError() << endl;
    } else if (frameworks[i]->IsOffline()) {
      for (const auto& metric: result.GetMetrics()) {
        evaluation.result.automatic_metrics[metric.first] = metric.second;
      }
    }
    evaluation.result.framework_scores.insert(
        make_pair(frameworks[i]->GetName(), result));
  }
  evaluation.processing_time = GetDuration(start_time, Clock::now());
  return evaluation;
}

vector<BulkItemResult> Orchestrator::EvaluateBulk(
    const vector<EvaluationContext>& contexts,
    const MetricSelection& selection, size_t batch_size,
    const ProgressCallback& progress_callback) const {
  if (batch_size == 0) {
    throw invalid_argument("The batch size must be positive");
  }

  size_t total = contexts.size();
  if (IsVerbose()) {
    cerr << "Starting bulk evaluation of " << total << " items" << endl;
  }

  vector<BulkItemResult> results(total);
  for (size_t batch_start = 0; batch_start < total;
       batch_start += batch_size) {
    size_t batch_end = min(total, batch_start + batch_size);

    #pragma omp parallel for schedule(dynamic) \
        num_threads(GetNumThreads(batch_end - batch_start))
    for (size_t i = batch_start; i < batch_end; ++i) {
      BulkItemResult& item = results[i];
      item.index = i;
      try {
        item.evaluation = EvaluateSingle(contexts[i], selection);
        item.status = COMPLETED;
      } catch (const exception& e) {
        item.status = FAILED;
        item.error = e.what();
      }
    }

    for (size_t i = batch_start; i < batch_end; ++i) {
      if (results[i].status == FAILED) {
        cerr << "Bulk evaluation item " << i << " failed: "
             << results[i].error << endl;
      }
    }

    double percentage = 100.0 * batch_end / total;
    if (IsVerbose()) {
      ostringstream progress;
      progress << fixed << setprecision(1) << percentage;
      cerr << "Bulk evaluation progress: " << batch_end << "/" << total
           << " (" << progress.str() << "%)" << endl;
    }
    if (progress_callback) {
      progress_callback(batch_end, total, percentage);
    }
  }

  if (IsVerbose()) {
    size_t num_failed = count_if(results.begin(), results.end(),
        [](const BulkItemResult& item) { return item.status == FAILED; });
    cerr << "Bulk evaluation completed: " << total - num_failed
         << " successful, " << num_failed << " failed" << endl;
  }
  return results;
}

map<string, vector<string> > Orchestrator::GetAvailableMetrics() const {
  map<string, vector<string> > metrics;
  for (auto framework: registry->GetFrameworks()) {
    metrics[framework->GetName()] = framework->GetAvailableMetrics();
  }
  return metrics;
}

FrameworkResult Orchestrator::Dispatch(const frameworks::Framework& framework,
                                       const EvaluationContext& context,
                                       const MetricSelection& selection) const {
  try {
    return framework.Run(context, selection);
  } catch (const exception& e) {
    return FrameworkResult::Error(framework.GetName(), e.what());
  } catch (...) {
    return FrameworkResult::Error(framework.GetName(),
                                  "unknown error in framework");
  }
}

int Orchestrator::GetNumThreads(size_t num_tasks) const {
  int num_threads = max<int>(1, num_tasks);
  if (max_threads > 0) {
    num_threads = min(num_threads, max_threads);
  }
  return num_threads;
}

} // namespace evaluator
