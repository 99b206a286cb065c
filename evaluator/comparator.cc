#include "comparator.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>

#include "verbosity.h"

namespace evaluator {

namespace {

struct RankedModel {
  string model_name;
  double score;
  double response_time;
  double cost;
};

bool RanksBefore(const RankedModel& a, const RankedModel& b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  if (a.response_time != b.response_time) {
    return a.response_time < b.response_time;
  }
  return a.cost < b.cost;
}

} // namespace

Comparator::Comparator(shared_ptr<Orchestrator> orchestrator,
                       shared_ptr<ResponseGenerator> generator,
                       const GenerationSettings& settings, int max_threads,
                       const PricingTable& pricing) :
    orchestrator(orchestrator), generator(generator), settings(settings),
    max_threads(max_threads), pricing(pricing) {}

Comparator::~Comparator() {}

ComparisonResult Comparator::CompareModels(
    const string& prompt, const vector<string>& models,
    const boost::optional<string>& context,
    const boost::optional<string>& expected_answer,
    const MetricSelection& selection) const {
  if (IsVerbose()) {
    cerr << "Comparing " << models.size() << " models on prompt" << endl;
  }

  ComparisonResult comparison;
  comparison.comparisons.resize(models.size());
  int num_threads = max<int>(1, models.size());
  if (max_threads > 0) {
    num_threads = min(num_threads, max_threads);
  }

  #pragma omp parallel for schedule(dynamic) num_threads(num_threads)
  for (size_t i = 0; i < models.size(); ++i) {
    comparison.comparisons[i] = CompareModel(
        models[i], prompt, context, expected_answer, selection);
  }

  for (const ComparisonEntry& entry: comparison.comparisons) {
    if (entry.status == FAILED) {
      cerr << "Model " << entry.model_name << " comparison failed: "
           << entry.error << endl;
    }
  }

  comparison.winner = DetermineWinner(comparison.comparisons);
  if (IsVerbose()) {
    cerr << "Model comparison completed, winner: "
         << (comparison.winner ? comparison.winner->model_name : "None")
         << endl;
  }
  return comparison;
}

ComparisonEntry Comparator::CompareModel(
    const string& model, const string& prompt,
    const boost::optional<string>& context,
    const boost::optional<string>& expected_answer,
    const MetricSelection& selection) const {
  ComparisonEntry entry;
  entry.model_name = model;
  try {
    GenerationResult generation = generator->Generate(
        GenerationRequest(model, prompt, context, settings));
    entry.response = generation.text;
    entry.response_time = generation.response_time;
    entry.tokens_used = generation.tokens_used;
    entry.cost = generation.cost;
    if (!entry.cost) {
      entry.cost = pricing.EstimateCost(
          model, generation.prompt_tokens, generation.completion_tokens);
    }

    EvaluationContext evaluation_context(
        prompt, generation.text, context, expected_answer);
    entry.result = orchestrator->EvaluateSingle(
        evaluation_context, selection).result;
  } catch (const exception& e) {
    entry.status = FAILED;
    entry.error = e.what();
    return entry;
  }

  for (const auto& metric: entry.result.automatic_metrics) {
    if (metric.second.score) {
      entry.metrics[metric.first] = *metric.second.score;
    }
  }
  entry.composite_score = ComputeCompositeScore(entry.result);
  entry.status = COMPLETED;
  return entry;
}

double Comparator::ComputeCompositeScore(const AggregatedResult& result) {
  vector<double> scores = result.GetNumericScores();
  if (scores.empty()) {
    return 0;
  }
  return accumulate(scores.begin(), scores.end(), 0.0) / scores.size();
}

boost::optional<Winner> Comparator::DetermineWinner(
    const vector<ComparisonEntry>& comparisons) {
  vector<RankedModel> ranking;
  for (const ComparisonEntry& entry: comparisons) {
    if (entry.status != COMPLETED) {
      continue;
    }
    RankedModel model = {
        entry.model_name,
        ComputeCompositeScore(entry.result),
        entry.response_time,
        entry.cost ? *entry.cost : 0
    };
    ranking.push_back(model);
  }
  if (ranking.empty()) {
    return boost::none;
  }

  stable_sort(ranking.begin(), ranking.end(), RanksBefore);

  const RankedModel& best = ranking[0];
  ostringstream reason;
  reason << fixed << setprecision(3) << "Highest overall score: "
         << best.score;
  if (ranking.size() > 1) {
    const RankedModel& runner_up = ranking[1];
    reason << " (" << best.score - runner_up.score << " points ahead of "
           << runner_up.model_name << ")";
  }

  Winner winner;
  winner.model_name = best.model_name;
  winner.reason = reason.str();
  return winner;
}

} // namespace evaluator
