#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "comparator.h"
#include "evaluation_error.h"
#include "mocks/mock_orchestrator.h"
#include "mocks/mock_response_generator.h"

using namespace std;
using namespace ::testing;

namespace evaluator {
namespace {

GenerationResult MakeGeneration(const string& text, double response_time,
                                const boost::optional<double>& cost) {
  GenerationResult generation;
  generation.text = text;
  generation.response_time = response_time;
  generation.tokens_used = 42;
  generation.cost = cost;
  return generation;
}

// Every metric of the evaluation gets the score written in the answer.
SingleEvaluation EvaluateAnswer(const EvaluationContext& context,
                                const MetricSelection&) {
  double score = stod(context.GetAnswer());
  SingleEvaluation evaluation;
  evaluation.result.automatic_metrics["coherence"] =
      MetricResult(score, true);
  FrameworkResult basic("basic");
  basic.SetMetric("coherence", MetricResult(score, true));
  evaluation.result.framework_scores.insert(make_pair("basic", basic));
  return evaluation;
}

class ComparatorTest : public Test {
 protected:
  virtual void SetUp() {
    orchestrator = make_shared<MockOrchestrator>();
    EXPECT_CALL(*orchestrator, EvaluateSingle(_, _))
        .WillRepeatedly(Invoke(EvaluateAnswer));
    generator = make_shared<MockResponseGenerator>();
    comparator = make_shared<Comparator>(orchestrator, generator);
  }

  void ExpectGeneration(const string& model,
                        const GenerationResult& generation) {
    EXPECT_CALL(*generator, Generate(Field(&GenerationRequest::model, model)))
        .WillOnce(Return(generation));
  }

  shared_ptr<MockOrchestrator> orchestrator;
  shared_ptr<MockResponseGenerator> generator;
  shared_ptr<Comparator> comparator;
};

TEST_F(ComparatorTest, TestCompareModels) {
  ExpectGeneration("model-a", MakeGeneration("0.6", 1.0, 0.002));
  ExpectGeneration("model-b", MakeGeneration("0.9", 3.0, 0.004));

  ComparisonResult result = comparator->CompareModels(
      "What is a cat?", {"model-a", "model-b"}, string("Cats are animals."));
  ASSERT_EQ(2, result.comparisons.size());

  const ComparisonEntry& first = result.comparisons[0];
  EXPECT_EQ("model-a", first.model_name);
  EXPECT_EQ("0.6", first.response);
  EXPECT_EQ(COMPLETED, first.status);
  EXPECT_EQ(1.0, first.response_time);
  EXPECT_EQ(42, first.tokens_used);
  EXPECT_EQ(0.002, *first.cost);
  EXPECT_DOUBLE_EQ(0.6, first.composite_score);
  EXPECT_DOUBLE_EQ(0.6, first.metrics.at("coherence"));

  EXPECT_EQ("model-b", result.comparisons[1].model_name);
  ASSERT_TRUE(result.winner);
  EXPECT_EQ("model-b", result.winner->model_name);
  EXPECT_EQ("Highest overall score: 0.900 (0.300 points ahead of model-a)",
            result.winner->reason);
}

TEST_F(ComparatorTest, TestTieBrokenByResponseTime) {
  ExpectGeneration("model-a", MakeGeneration("0.9", 2.0, 0.01));
  ExpectGeneration("model-b", MakeGeneration("0.9", 1.0, 0.02));

  ComparisonResult result = comparator->CompareModels(
      "prompt", {"model-a", "model-b"});
  ASSERT_TRUE(result.winner);
  EXPECT_EQ("model-b", result.winner->model_name);
  EXPECT_EQ("Highest overall score: 0.900 (0.000 points ahead of model-a)",
            result.winner->reason);
}

TEST_F(ComparatorTest, TestTieBrokenByCost) {
  ExpectGeneration("model-a", MakeGeneration("0.8", 1.0, 0.01));
  ExpectGeneration("model-b", MakeGeneration("0.8", 1.0, 0.002));

  ComparisonResult result = comparator->CompareModels(
      "prompt", {"model-a", "model-b"});
  ASSERT_TRUE(result.winner);
  EXPECT_EQ("model-b", result.winner->model_name);
}

TEST_F(ComparatorTest, TestFailingModelIsExcluded) {
  ExpectGeneration("model-a", MakeGeneration("0.7", 1.0, boost::none));
  ExpectGeneration("model-b", MakeGeneration("0.5", 1.0, boost::none));
  EXPECT_CALL(*generator, Generate(Field(&GenerationRequest::model,
                                         "model-c")))
      .WillOnce(Throw(GenerationError("rate limit exceeded")));

  ComparisonResult result = comparator->CompareModels(
      "prompt", {"model-a", "model-b", "model-c"});
  ASSERT_EQ(3, result.comparisons.size());
  EXPECT_EQ(FAILED, result.comparisons[2].status);
  EXPECT_EQ("rate limit exceeded", result.comparisons[2].error);
  ASSERT_TRUE(result.winner);
  EXPECT_EQ("model-a", result.winner->model_name);
}

TEST_F(ComparatorTest, TestFailingEvaluation) {
  EXPECT_CALL(*orchestrator, EvaluateSingle(
      Property(&EvaluationContext::GetAnswer, ""), _))
      .WillRepeatedly(Throw(ValidationError("empty context")));
  ExpectGeneration("model-a", MakeGeneration("", 1.0, boost::none));

  ComparisonResult result = comparator->CompareModels("", {"model-a"});
  ASSERT_EQ(1, result.comparisons.size());
  EXPECT_EQ(FAILED, result.comparisons[0].status);
  EXPECT_EQ("empty context", result.comparisons[0].error);
  EXPECT_FALSE(result.winner);
}

TEST_F(ComparatorTest, TestSingleModel) {
  ExpectGeneration("model-a", MakeGeneration("0.75", 1.0, boost::none));
  ComparisonResult result = comparator->CompareModels("prompt", {"model-a"});
  ASSERT_TRUE(result.winner);
  EXPECT_EQ("Highest overall score: 0.750", result.winner->reason);
}

TEST(ComparatorScoreTest, TestComputeCompositeScore) {
  AggregatedResult result;
  EXPECT_EQ(0, Comparator::ComputeCompositeScore(result));

  result.automatic_metrics["bleu"] = MetricResult(0.2, true);
  result.automatic_metrics["rouge1"] = MetricResult::Missing("no reference");
  FrameworkResult ragas("ragas");
  ragas.SetMetric("faithfulness", MetricResult(0.8, true));
  result.framework_scores.insert(make_pair("ragas", ragas));
  result.framework_scores.insert(make_pair(
      "deepeval", FrameworkResult::Error("deepeval", "timeout")));
  EXPECT_DOUBLE_EQ(0.5, Comparator::ComputeCompositeScore(result));
}

TEST(ComparatorScoreTest, TestDetermineWinnerWithoutCompletedModels) {
  vector<ComparisonEntry> comparisons(2);
  comparisons[0].model_name = "model-a";
  comparisons[1].model_name = "model-b";
  EXPECT_FALSE(Comparator::DetermineWinner(comparisons));
  EXPECT_FALSE(Comparator::DetermineWinner(vector<ComparisonEntry>()));
}

TEST_F(ComparatorTest, TestMissingCostIsEstimated) {
  GenerationResult generation = MakeGeneration("0.5", 1.0, boost::none);
  generation.prompt_tokens = 1000;
  generation.completion_tokens = 500;
  ExpectGeneration("openai/gpt-4", generation);
  GenerationResult unpriced = MakeGeneration("0.5", 1.0, boost::none);
  unpriced.prompt_tokens = 1000;
  ExpectGeneration("local/llama", unpriced);
  ExpectGeneration("model-c", MakeGeneration("0.5", 1.0, 0.5));

  ComparisonResult result = comparator->CompareModels(
      "prompt", {"openai/gpt-4", "local/llama", "model-c"});
  ASSERT_EQ(3, result.comparisons.size());
  ASSERT_TRUE(result.comparisons[0].cost);
  EXPECT_DOUBLE_EQ(0.06, *result.comparisons[0].cost);
  EXPECT_FALSE(result.comparisons[1].cost);
  EXPECT_EQ(0.5, *result.comparisons[2].cost);
}

TEST(ComparatorPricingTest, TestCustomPricingTable) {
  map<string, PricingTable::Price> prices;
  prices["model-a"] = {0.01, 0.02};
  shared_ptr<MockOrchestrator> orchestrator = make_shared<MockOrchestrator>();
  EXPECT_CALL(*orchestrator, EvaluateSingle(_, _))
      .WillRepeatedly(Invoke(EvaluateAnswer));
  shared_ptr<MockResponseGenerator> generator =
      make_shared<MockResponseGenerator>();
  GenerationResult generation = MakeGeneration("0.5", 1.0, boost::none);
  generation.prompt_tokens = 2000;
  generation.completion_tokens = 1000;
  EXPECT_CALL(*generator, Generate(_)).WillOnce(Return(generation));

  Comparator comparator(orchestrator, generator, GenerationSettings(), 0,
                        PricingTable(prices));
  ComparisonResult result = comparator.CompareModels("prompt", {"model-a"});
  ASSERT_EQ(1, result.comparisons.size());
  EXPECT_DOUBLE_EQ(0.04, *result.comparisons[0].cost);
}

} // namespace
} // namespace evaluator
