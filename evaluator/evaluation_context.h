#ifndef _EVALUATION_CONTEXT_H_
#define _EVALUATION_CONTEXT_H_

#include <string>
#include <vector>

#include <boost/optional.hpp>

using namespace std;

namespace evaluator {

// Ordered list of requested metric names. Empty means every applicable metric.
typedef vector<string> MetricSelection;

/**
 * Input of a single evaluation: the question, the generated answer and the
 * optional grounding data. Instances are never modified after construction.
 *
 * An optional field that is present but empty is treated as missing.
 */
class EvaluationContext {
 public:
  EvaluationContext(const string& question, const string& answer,
                    const boost::optional<string>& context = boost::none,
                    const boost::optional<string>& expected_answer =
                        boost::none,
                    const boost::optional<string>& category = boost::none);

  const string& GetQuestion() const { return question; }

  const string& GetAnswer() const { return answer; }

  bool HasContext() const;

  bool HasExpectedAnswer() const;

  bool HasCategory() const;

  // Returns the corresponding field or the empty string when it is missing.
  const string& GetContext() const;

  const string& GetExpectedAnswer() const;

  const string& GetCategory() const;

  // Throws ValidationError if the context cannot be evaluated at all.
  void Validate() const;

 private:
  string question;
  string answer;
  boost::optional<string> context;
  boost::optional<string> expected_answer;
  boost::optional<string> category;
};

} // namespace evaluator

#endif
