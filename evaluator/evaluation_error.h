#ifndef _EVALUATION_ERROR_H_
#define _EVALUATION_ERROR_H_

#include <stdexcept>
#include <string>

using namespace std;

namespace evaluator {

/**
 * Base class for the failures raised while evaluating a response. They are
 * caught at the smallest enclosing scope (metric, framework, bulk item or
 * compared model) and turned into error entries.
 */
class EvaluationError : public runtime_error {
 public:
  explicit EvaluationError(const string& message) : runtime_error(message) {}
};

// The evaluation context or the call arguments are malformed.
class ValidationError : public EvaluationError {
 public:
  explicit ValidationError(const string& message) : EvaluationError(message) {}
};

// The response generator could not produce a response for a model.
class GenerationError : public EvaluationError {
 public:
  explicit GenerationError(const string& message) : EvaluationError(message) {}
};

// The external score server failed, timed out or sent a malformed reply.
class ScoreServerError : public EvaluationError {
 public:
  explicit ScoreServerError(const string& message) :
      EvaluationError(message) {}
};

} // namespace evaluator

#endif
