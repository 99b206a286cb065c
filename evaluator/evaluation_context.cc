#include "evaluation_context.h"

#include "evaluation_error.h"

namespace evaluator {

namespace {

const string EMPTY_FIELD;

bool IsPresent(const boost::optional<string>& field) {
  return field && !field->empty();
}

} // namespace

EvaluationContext::EvaluationContext(
    const string& question, const string& answer,
    const boost::optional<string>& context,
    const boost::optional<string>& expected_answer,
    const boost::optional<string>& category) :
    question(question), answer(answer), context(context),
    expected_answer(expected_answer), category(category) {}

bool EvaluationContext::HasContext() const {
  return IsPresent(context);
}

bool EvaluationContext::HasExpectedAnswer() const {
  return IsPresent(expected_answer);
}

bool EvaluationContext::HasCategory() const {
  return IsPresent(category);
}

const string& EvaluationContext::GetContext() const {
  return HasContext() ? *context : EMPTY_FIELD;
}

const string& EvaluationContext::GetExpectedAnswer() const {
  return HasExpectedAnswer() ? *expected_answer : EMPTY_FIELD;
}

const string& EvaluationContext::GetCategory() const {
  return HasCategory() ? *category : EMPTY_FIELD;
}

void EvaluationContext::Validate() const {
  if (question.empty() && answer.empty()) {
    throw ValidationError("evaluation context has neither question nor answer");
  }
}

} // namespace evaluator
