#ifndef _EXTERNAL_FRAMEWORK_H_
#define _EXTERNAL_FRAMEWORK_H_

#include <memory>
#include <string>
#include <vector>

#include "framework.h"

using namespace std;

namespace evaluator {
namespace frameworks {

class ScoreServer;

/**
 * A metric offered by an external scorer together with the data it needs.
 */
struct MetricDeclaration {
  MetricDeclaration(const string& name, bool needs_context = false,
                    bool needs_expected_answer = false) :
      name(name), needs_context(needs_context),
      needs_expected_answer(needs_expected_answer) {}

  bool operator==(const MetricDeclaration& other) const {
    return name == other.name && needs_context == other.needs_context &&
           needs_expected_answer == other.needs_expected_answer;
  }

  string name;
  bool needs_context;
  bool needs_expected_answer;
};

/**
 * Framework delegating to a third-party evaluation library running behind a
 * score server.
 *
 * Protocol (one line per message):
 *   METRICS
 *     -> name[@c|@e|@ce] ...   (c: needs context, e: needs expected answer)
 *   SCORE ||| question ||| answer ||| context ||| expected ||| m1 m2 ...
 *     -> m1=VALUE ||| m2=VALUE ...
 *     -> ERROR ||| message      (the whole request failed)
 *
 * where VALUE is one of
 *   0.75                    a passing score
 *   0.75|pass|reason        a score with its verdict (pass or fail) and an
 *   0.31|fail|reason        optional explanation
 *   NA[|reason]             the library produced no score
 *   ERROR[|reason]          the metric failed
 *
 * Only the metrics whose requirements are met by the context are requested
 * and the response must score exactly those.
 */
class ExternalFramework : public Framework {
 public:
  // Asks the server for its metric declarations.
  ExternalFramework(const string& name, shared_ptr<ScoreServer> server);

  ExternalFramework(const string& name, shared_ptr<ScoreServer> server,
                    const vector<MetricDeclaration>& metrics);

  FrameworkResult Run(const EvaluationContext& context,
                      const MetricSelection& selection) const;

  string GetName() const;

  vector<string> GetAvailableMetrics() const;

  // Returns the requested metrics the context has enough data for, in
  // declaration order.
  vector<string> GetApplicableMetrics(const EvaluationContext& context,
                                      const MetricSelection& selection) const;

  static vector<MetricDeclaration> ParseMetricDeclarations(
      const string& response);

  static string EncodeRequest(const EvaluationContext& context,
                              const vector<string>& metrics);

  // Throws ScoreServerError if the response is malformed or does not score
  // exactly the requested metrics.
  static FrameworkResult ParseScores(const string& framework_name,
                                     const vector<string>& requested,
                                     const string& response);

  static MetricResult ParseMetricValue(const string& framework_name,
                                       const string& value);

 private:
  string name;
  shared_ptr<ScoreServer> server;
  vector<MetricDeclaration> metrics;
};

} // namespace frameworks
} // namespace evaluator

#endif
