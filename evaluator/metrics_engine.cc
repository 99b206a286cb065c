#include "metrics_engine.h"

#include <iostream>
#include <stdexcept>

#include "heuristic_scorers.h"
#include "ngram_metrics.h"

namespace evaluator {

MetricsEngine::MetricsEngine() {
  typedef const EvaluationContext& Context;
  catalog = {
    {"rouge1", true, [](Context c) {
      return ComputeRouge(c.GetAnswer(), c.GetExpectedAnswer()).rouge1.f1;
    }},
    {"rouge2", true, [](Context c) {
      return ComputeRouge(c.GetAnswer(), c.GetExpectedAnswer()).rouge2.f1;
    }},
    {"rougeL", true, [](Context c) {
      return ComputeRouge(c.GetAnswer(), c.GetExpectedAnswer()).rougeL.f1;
    }},
    {"bleu", true, [](Context c) {
      return ComputeBleu(c.GetAnswer(), c.GetExpectedAnswer());
    }},
    {"meteor_approx", true, [](Context c) {
      return MeteorApprox(c.GetAnswer(), c.GetExpectedAnswer());
    }},
    {"coherence", false, [](Context c) {
      return Coherence(c.GetAnswer());
    }},
    {"relevance", false, [](Context c) {
      return Relevance(c.GetQuestion(), c.GetAnswer(), c.GetContext());
    }},
    {"fluency", false, [](Context c) {
      return Fluency(c.GetAnswer());
    }},
    {"informativeness", false, [](Context c) {
      return Informativeness(c.GetAnswer());
    }},
    {"length_ratio", true, [](Context c) {
      return LengthRatio(c.GetAnswer(), c.GetExpectedAnswer());
    }},
    {"word_overlap", true, [](Context c) {
      return WordOverlap(c.GetAnswer(), c.GetExpectedAnswer());
    }},
    {"sentence_similarity", true, [](Context c) {
      return SentenceSimilarity(c.GetAnswer(), c.GetExpectedAnswer());
    }}
  };
}

MetricsEngine::MetricsEngine(const vector<Metric>& catalog) :
    catalog(catalog) {}

MetricsEngine::~MetricsEngine() {}

map<string, double> MetricsEngine::Evaluate(
    const EvaluationContext& context, const MetricSelection& selection,
    map<string, string>* failures) const {
  vector<const Metric*> metrics;
  if (selection.empty()) {
    for (const Metric& metric: catalog) {
      metrics.push_back(&metric);
    }
  } else {
    for (const string& metric_name: selection) {
      const Metric* metric = FindMetric(metric_name);
      if (metric != NULL) {
        metrics.push_back(metric);
      }
    }
  }

  map<string, double> scores;
  for (const Metric* metric: metrics) {
    if (metric->requires_reference && !context.HasExpectedAnswer()) {
      continue;
    }

    double score = 0;
    try {
      score = metric->function(context);
    } catch (const exception& e) {
      cerr << "Metric " << metric->name << " failed: " << e.what() << endl;
      if (failures != NULL) {
        (*failures)[metric->name] = e.what();
      }
    }
    scores[metric->name] = score;
  }
  return scores;
}

vector<string> MetricsEngine::GetAvailableMetrics() const {
  vector<string> metric_names;
  for (const Metric& metric: catalog) {
    metric_names.push_back(metric.name);
  }
  return metric_names;
}

bool MetricsEngine::RequiresReference(const string& metric_name) const {
  const Metric* metric = FindMetric(metric_name);
  if (metric == NULL) {
    throw invalid_argument("Unknown metric: " + metric_name);
  }
  return metric->requires_reference;
}

const MetricsEngine::Metric* MetricsEngine::FindMetric(
    const string& metric_name) const {
  for (const Metric& metric: catalog) {
    if (metric.name == metric_name) {
      return &metric;
    }
  }
  return NULL;
}

} // namespace evaluator
