#ifndef _COMPARATOR_H_
#define _COMPARATOR_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "evaluation_context.h"
#include "metric_result.h"
#include "orchestrator.h"
#include "response_generator.h"

using namespace std;

namespace evaluator {

/**
 * Evaluation of one model's response in a comparison.
 */
struct ComparisonEntry {
  ComparisonEntry() :
      response_time(0), tokens_used(0), composite_score(0), status(FAILED) {}

  string model_name;
  string response;
  // Numeric scores of the automatic metrics.
  map<string, double> metrics;
  AggregatedResult result;
  double response_time;
  int tokens_used;
  boost::optional<double> cost;
  double composite_score;
  EvaluationStatus status;
  string error;
};

struct Winner {
  string model_name;
  string reason;
};

struct ComparisonResult {
  vector<ComparisonEntry> comparisons;
  boost::optional<Winner> winner;
};

/**
 * Generates a response for the same prompt with several models, evaluates
 * every response and picks the best model.
 *
 * Models are ranked by composite score (higher first), then response time
 * and then cost (lower first). A response whose generator reports no cost is
 * priced from its token counts with the pricing table. A model whose
 * generation or evaluation fails is reported as failed and takes no part in
 * the ranking.
 */
class Comparator {
 public:
  Comparator(shared_ptr<Orchestrator> orchestrator,
             shared_ptr<ResponseGenerator> generator,
             const GenerationSettings& settings = GenerationSettings(),
             int max_threads = 0,
             const PricingTable& pricing = PricingTable());

  virtual ~Comparator();

  ComparisonResult CompareModels(
      const string& prompt, const vector<string>& models,
      const boost::optional<string>& context = boost::none,
      const boost::optional<string>& expected_answer = boost::none,
      const MetricSelection& selection = MetricSelection()) const;

  // Mean of every numeric score in the automatic metrics and in the
  // framework entries that did not fail. 0 if there is none.
  static double ComputeCompositeScore(const AggregatedResult& result);

  // Returns nothing if no model completed.
  static boost::optional<Winner> DetermineWinner(
      const vector<ComparisonEntry>& comparisons);

 private:
  ComparisonEntry CompareModel(const string& model, const string& prompt,
                               const boost::optional<string>& context,
                               const boost::optional<string>& expected_answer,
                               const MetricSelection& selection) const;

  shared_ptr<Orchestrator> orchestrator;
  shared_ptr<ResponseGenerator> generator;
  GenerationSettings settings;
  int max_threads;
  PricingTable pricing;
};

} // namespace evaluator

#endif
