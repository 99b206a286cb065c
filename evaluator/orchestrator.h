#ifndef _ORCHESTRATOR_H_
#define _ORCHESTRATOR_H_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "evaluation_context.h"
#include "metric_result.h"

using namespace std;

namespace evaluator {

namespace frameworks {
  class Framework;
} // namespace frameworks

class FrameworkRegistry;

enum EvaluationStatus { COMPLETED, FAILED };

string GetStatusName(EvaluationStatus status);

/**
 * Merged framework results for one context and the wall-clock time it took
 * to compute them, in seconds.
 */
struct SingleEvaluation {
  SingleEvaluation() : processing_time(0) {}

  AggregatedResult result;
  double processing_time;
};

/**
 * Outcome of one item of a bulk evaluation. The error is only set for failed
 * items, the evaluation only for completed ones.
 */
struct BulkItemResult {
  BulkItemResult() : index(0), status(FAILED) {}

  size_t index;
  EvaluationStatus status;
  SingleEvaluation evaluation;
  string error;
};

// Called after every batch with the number of processed items, the total
// number of items and the percentage done.
typedef function<void(size_t, size_t, double)> ProgressCallback;

/**
 * Dispatches evaluation contexts to every framework of the registry.
 *
 * The frameworks run concurrently and a failing framework only turns its own
 * entry into an error: the other entries are kept and the evaluation still
 * completes. The orchestrator holds no state besides the read-only registry
 * and can be shared by concurrent callers.
 */
class Orchestrator {
 public:
  // Runs at most max_threads tasks at a time, 0 meaning one thread per task.
  Orchestrator(shared_ptr<FrameworkRegistry> registry, int max_threads = 0);

  virtual ~Orchestrator();

  // Throws ValidationError if the context cannot be evaluated. Framework
  // failures never throw.
  virtual SingleEvaluation EvaluateSingle(
      const EvaluationContext& context,
      const MetricSelection& selection = MetricSelection()) const;

  // Evaluates the contexts in batches of batch_size concurrent items. The
  // results are in input order and a failing item yields a failed record.
  // Throws invalid_argument if batch_size is 0.
  vector<BulkItemResult> EvaluateBulk(
      const vector<EvaluationContext>& contexts,
      const MetricSelection& selection = MetricSelection(),
      size_t batch_size = DEFAULT_BATCH_SIZE,
      const ProgressCallback& progress_callback = ProgressCallback()) const;

  // Returns the metrics offered by each framework.
  map<string, vector<string> > GetAvailableMetrics() const;

  static const size_t DEFAULT_BATCH_SIZE;

 protected:
  // For testing only.
  Orchestrator();

 private:
  // Runs one framework and turns any exception it throws into an error entry.
  FrameworkResult Dispatch(const frameworks::Framework& framework,
                           const EvaluationContext& context,
                           const MetricSelection& selection) const;

  int GetNumThreads(size_t num_tasks) const;

  shared_ptr<FrameworkRegistry> registry;
  int max_threads;
};

} // namespace evaluator

#endif
