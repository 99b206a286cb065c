#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "evaluation_error.h"
#include "external_framework.h"
#include "mocks/mock_score_server.h"

using namespace std;
using namespace ::testing;

namespace evaluator {
namespace frameworks {
namespace {

class ExternalFrameworkTest : public Test {
 protected:
  virtual void SetUp() {
    server = make_shared<MockScoreServer>();
    vector<MetricDeclaration> metrics = {
        MetricDeclaration("answer_relevancy"),
        MetricDeclaration("faithfulness", true, false),
        MetricDeclaration("answer_correctness", false, true),
        MetricDeclaration("context_recall", true, true)
    };
    framework = make_shared<ExternalFramework>("ragas", server, metrics);
  }

  shared_ptr<MockScoreServer> server;
  shared_ptr<ExternalFramework> framework;
};

TEST_F(ExternalFrameworkTest, TestGetName) {
  EXPECT_EQ("ragas", framework->GetName());
  EXPECT_FALSE(framework->IsOffline());
}

TEST_F(ExternalFrameworkTest, TestGetAvailableMetrics) {
  vector<string> expected_metrics = {
      "answer_relevancy", "faithfulness", "answer_correctness",
      "context_recall"
  };
  EXPECT_EQ(expected_metrics, framework->GetAvailableMetrics());
}

TEST_F(ExternalFrameworkTest, TestGetApplicableMetrics) {
  EvaluationContext bare("question", "answer");
  vector<string> expected_metrics = {"answer_relevancy"};
  EXPECT_EQ(expected_metrics,
            framework->GetApplicableMetrics(bare, MetricSelection()));

  EvaluationContext with_context("question", "answer", string("context"));
  expected_metrics = {"answer_relevancy", "faithfulness"};
  EXPECT_EQ(expected_metrics,
            framework->GetApplicableMetrics(with_context, MetricSelection()));

  EvaluationContext full("question", "answer", string("context"),
                         string("expected"));
  expected_metrics = {"faithfulness", "context_recall"};
  EXPECT_EQ(expected_metrics, framework->GetApplicableMetrics(
      full, {"context_recall", "bleu", "faithfulness"}));
}

TEST_F(ExternalFrameworkTest, TestRun) {
  EvaluationContext context("What is it?", "A cat.\nReally.",
                            string("Cats ||| dogs"));
  EXPECT_CALL(*server, RequestResponse(
      "SCORE ||| What is it? ||| A cat. Really. ||| Cats | | | dogs ||| "
      " ||| answer_relevancy faithfulness"))
      .WillOnce(Return("answer_relevancy=0.75 ||| faithfulness=NA"));

  FrameworkResult result = framework->Run(context, MetricSelection());
  EXPECT_FALSE(result.IsError());
  EXPECT_EQ(MetricResult(0.75, true), result.GetMetric("answer_relevancy"));
  EXPECT_FALSE(result.GetMetric("faithfulness").score);
  EXPECT_FALSE(result.GetMetric("faithfulness").success);
}

TEST_F(ExternalFrameworkTest, TestRunWithoutApplicableMetrics) {
  EXPECT_CALL(*server, RequestResponse(_)).Times(0);
  EvaluationContext context("question", "answer");
  FrameworkResult result = framework->Run(context, {"context_recall"});
  EXPECT_FALSE(result.IsError());
  EXPECT_EQ(0, result.size());
}

TEST_F(ExternalFrameworkTest, TestRunReportsServerFailure) {
  EXPECT_CALL(*server, RequestResponse(_))
      .WillOnce(Throw(ScoreServerError("score server timed out after 10 ms")));
  EvaluationContext context("question", "answer");
  FrameworkResult result = framework->Run(context, MetricSelection());
  EXPECT_TRUE(result.IsError());
  EXPECT_EQ("score server timed out after 10 ms", result.GetError());
}

TEST_F(ExternalFrameworkTest, TestRunReportsLibraryError) {
  EXPECT_CALL(*server, RequestResponse(_))
      .WillOnce(Return("ERROR ||| missing API key"));
  EvaluationContext context("question", "answer");
  FrameworkResult result = framework->Run(context, MetricSelection());
  EXPECT_TRUE(result.IsError());
  EXPECT_EQ("missing API key", result.GetError());
}

TEST_F(ExternalFrameworkTest, TestRunReportsMalformedResponse) {
  EXPECT_CALL(*server, RequestResponse(_))
      .WillOnce(Return("answer_relevancy=high"));
  EvaluationContext context("question", "answer");
  FrameworkResult result = framework->Run(context, MetricSelection());
  EXPECT_TRUE(result.IsError());
}

TEST_F(ExternalFrameworkTest, TestHandshake) {
  EXPECT_CALL(*server, RequestResponse("METRICS"))
      .WillOnce(Return("toxicity faithfulness@c contextual_precision@ce"));
  ExternalFramework deepeval("deepeval", server);
  vector<string> expected_metrics = {
      "toxicity", "faithfulness", "contextual_precision"
  };
  EXPECT_EQ(expected_metrics, deepeval.GetAvailableMetrics());
}

TEST_F(ExternalFrameworkTest, TestHandshakeWithoutMetrics) {
  EXPECT_CALL(*server, RequestResponse("METRICS")).WillOnce(Return(""));
  EXPECT_THROW(ExternalFramework("deepeval", server), ScoreServerError);
}

TEST(ExternalFrameworkParsingTest, TestParseMetricDeclarations) {
  vector<MetricDeclaration> expected_declarations = {
      MetricDeclaration("bias"),
      MetricDeclaration("hallucination", true, false),
      MetricDeclaration("answer_similarity", false, true),
      MetricDeclaration("contextual_recall", true, true)
  };
  EXPECT_EQ(expected_declarations, ExternalFramework::ParseMetricDeclarations(
      " bias hallucination@c answer_similarity@e  contextual_recall@ec "));
  EXPECT_THROW(ExternalFramework::ParseMetricDeclarations("bias@x"),
               ScoreServerError);
  EXPECT_THROW(ExternalFramework::ParseMetricDeclarations("bias@"),
               ScoreServerError);
}

TEST(ExternalFrameworkParsingTest, TestParseScores) {
  vector<string> requested = {"a", "b", "c", "d"};
  FrameworkResult result = ExternalFramework::ParseScores(
      "ragas", requested, "a=0.5 ||| b=1.7 ||| c=-2 ||| d=NA");
  EXPECT_EQ(4, result.size());
  EXPECT_EQ(MetricResult(0.5, true), result.GetMetric("a"));
  EXPECT_EQ(1.0, *result.GetMetric("b").score);
  EXPECT_EQ(0.0, *result.GetMetric("c").score);
  EXPECT_EQ(MetricResult::Missing("no score produced by ragas"),
            result.GetMetric("d"));

  EXPECT_EQ(0, ExternalFramework::ParseScores(
      "ragas", vector<string>(), "").size());
}

TEST(ExternalFrameworkParsingTest, TestParseScoresWithVerdicts) {
  vector<string> requested = {
      "answer_relevancy", "faithfulness", "bias", "toxicity", "hallucination"
  };
  FrameworkResult result = ExternalFramework::ParseScores(
      "deepeval", requested,
      "answer_relevancy=0.82|pass|The answer addresses the question ||| "
      "faithfulness=0.31|fail|Claims are not supported | see context ||| "
      "bias=ERROR|rate limit exceeded ||| "
      "toxicity=0.05|pass ||| "
      "hallucination=NA|no context given");

  EXPECT_EQ(MetricResult(0.82, true,
                         string("The answer addresses the question")),
            result.GetMetric("answer_relevancy"));
  EXPECT_EQ(MetricResult(0.31, false,
                         string("Claims are not supported | see context")),
            result.GetMetric("faithfulness"));
  EXPECT_EQ(MetricResult::Missing("Evaluation failed: rate limit exceeded"),
            result.GetMetric("bias"));
  EXPECT_EQ(MetricResult(0.05, true), result.GetMetric("toxicity"));
  EXPECT_EQ(MetricResult::Missing("no context given"),
            result.GetMetric("hallucination"));
}

TEST(ExternalFrameworkParsingTest, TestParseScoresRejectsMalformedValues) {
  vector<string> requested = {"a"};
  EXPECT_THROW(ExternalFramework::ParseScores("ragas", requested, "a"),
               ScoreServerError);
  EXPECT_THROW(ExternalFramework::ParseScores("ragas", requested, "=0.5"),
               ScoreServerError);
  EXPECT_THROW(ExternalFramework::ParseScores("ragas", requested, "a=nan"),
               ScoreServerError);
  EXPECT_THROW(ExternalFramework::ParseScores("ragas", requested,
                                              "a=0.5|maybe|unsure"),
               ScoreServerError);
}

TEST(ExternalFrameworkParsingTest, TestParseScoresChecksRequestedMetrics) {
  vector<string> requested = {"a", "b"};
  EXPECT_THROW(ExternalFramework::ParseScores("ragas", requested, "a=0.5"),
               ScoreServerError);
  EXPECT_THROW(ExternalFramework::ParseScores("ragas", requested, ""),
               ScoreServerError);
  EXPECT_THROW(ExternalFramework::ParseScores(
      "ragas", requested, "a=0.5 ||| b=0.5 ||| c=0.5"), ScoreServerError);
  EXPECT_THROW(ExternalFramework::ParseScores(
      "ragas", requested, "a=0.5 ||| a=0.6 ||| b=0.5"), ScoreServerError);
}

TEST_F(ExternalFrameworkTest, TestRunReportsIncompleteResponse) {
  EXPECT_CALL(*server, RequestResponse(_))
      .WillOnce(Return("faithfulness=0.4"));
  EvaluationContext context("question", "answer", string("context"));
  FrameworkResult result = framework->Run(context, MetricSelection());
  EXPECT_TRUE(result.IsError());
  EXPECT_EQ("missing metric in response: answer_relevancy", result.GetError());
}

} // namespace
} // namespace frameworks
} // namespace evaluator
