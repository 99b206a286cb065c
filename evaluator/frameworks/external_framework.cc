#include "external_framework.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

#include "evaluation_error.h"
#include "score_server.h"

namespace evaluator {
namespace frameworks {

namespace {

const string SEPARATOR = " ||| ";
const string ERROR_PREFIX = "ERROR |||";
const string MISSING_SCORE = "NA";
const string FAILED_SCORE = "ERROR";
const string PASSED_STATUS = "pass";
const string FAILED_STATUS = "fail";
const boost::regex ENTRY_SEPARATOR("\\s*\\|\\|\\|\\s*");

// Keeps a field on one line and out of the way of the separator.
string EscapeField(const string& field) {
  string escaped = field;
  for (char& c: escaped) {
    if (c == '\n' || c == '\r' || c == '\t') {
      c = ' ';
    }
  }
  boost::algorithm::replace_all(escaped, "|||", "| | |");
  return escaped;
}

} // namespace

ExternalFramework::ExternalFramework(const string& name,
                                     shared_ptr<ScoreServer> server) :
    name(name), server(server) {
  metrics = ParseMetricDeclarations(server->RequestResponse("METRICS"));
  if (metrics.empty()) {
    throw ScoreServerError("score server for " + name +
                           " does not declare any metric");
  }
}

ExternalFramework::ExternalFramework(
    const string& name, shared_ptr<ScoreServer> server,
    const vector<MetricDeclaration>& metrics) :
    name(name), server(server), metrics(metrics) {}

FrameworkResult ExternalFramework::Run(const EvaluationContext& context,
                                       const MetricSelection& selection) const {
  vector<string> requested = GetApplicableMetrics(context, selection);
  if (requested.empty()) {
    return FrameworkResult(name);
  }

  try {
    string response = server->RequestResponse(
        EncodeRequest(context, requested));
    return ParseScores(name, requested, response);
  } catch (const ScoreServerError& e) {
    return FrameworkResult::Error(name, e.what());
  }
}

string ExternalFramework::GetName() const {
  return name;
}

vector<string> ExternalFramework::GetAvailableMetrics() const {
  vector<string> metric_names;
  for (const MetricDeclaration& metric: metrics) {
    metric_names.push_back(metric.name);
  }
  return metric_names;
}

vector<string> ExternalFramework::GetApplicableMetrics(
    const EvaluationContext& context, const MetricSelection& selection) const {
  vector<string> applicable;
  for (const MetricDeclaration& metric: metrics) {
    if (!selection.empty() &&
        find(selection.begin(), selection.end(), metric.name) ==
            selection.end()) {
      continue;
    }
    if (metric.needs_context && !context.HasContext()) {
      continue;
    }
    if (metric.needs_expected_answer && !context.HasExpectedAnswer()) {
      continue;
    }
    applicable.push_back(metric.name);
  }
  return applicable;
}

vector<MetricDeclaration> ExternalFramework::ParseMetricDeclarations(
    const string& response) {
  vector<MetricDeclaration> declarations;
  istringstream buffer(response);
  string token;
  while (buffer >> token) {
    size_t position = token.find('@');
    if (position == string::npos) {
      declarations.push_back(MetricDeclaration(token));
      continue;
    }
    string requirements = token.substr(position + 1);
    if (requirements.empty() ||
        requirements.find_first_not_of("ce") != string::npos) {
      throw ScoreServerError("malformed metric declaration: " + token);
    }
    declarations.push_back(MetricDeclaration(
        token.substr(0, position),
        requirements.find('c') != string::npos,
        requirements.find('e') != string::npos));
  }
  return declarations;
}

string ExternalFramework::EncodeRequest(const EvaluationContext& context,
                                        const vector<string>& metrics) {
  ostringstream request;
  request << "SCORE" << SEPARATOR << EscapeField(context.GetQuestion())
          << SEPARATOR << EscapeField(context.GetAnswer())
          << SEPARATOR << EscapeField(context.GetContext())
          << SEPARATOR << EscapeField(context.GetExpectedAnswer())
          << SEPARATOR << boost::algorithm::join(metrics, " ");
  return request.str();
}

FrameworkResult ExternalFramework::ParseScores(
    const string& framework_name, const vector<string>& requested,
    const string& response) {
  if (boost::algorithm::starts_with(response, ERROR_PREFIX)) {
    return FrameworkResult::Error(framework_name, boost::algorithm::trim_copy(
        response.substr(ERROR_PREFIX.size())));
  }

  vector<string> entries;
  string trimmed = boost::algorithm::trim_copy(response);
  if (!trimmed.empty()) {
    boost::algorithm::split_regex(entries, trimmed, ENTRY_SEPARATOR);
  }

  FrameworkResult result(framework_name);
  for (const string& entry: entries) {
    size_t position = entry.find('=');
    if (position == string::npos || position == 0) {
      throw ScoreServerError("malformed score: " + entry);
    }
    string metric_name = boost::algorithm::trim_copy(entry.substr(0, position));
    if (find(requested.begin(), requested.end(), metric_name) ==
        requested.end()) {
      throw ScoreServerError("unexpected metric in response: " + metric_name);
    }
    if (result.HasMetric(metric_name)) {
      throw ScoreServerError("duplicate metric in response: " + metric_name);
    }
    result.SetMetric(metric_name, ParseMetricValue(
        framework_name, entry.substr(position + 1)));
  }

  for (const string& metric_name: requested) {
    if (!result.HasMetric(metric_name)) {
      throw ScoreServerError("missing metric in response: " + metric_name);
    }
  }
  return result;
}

MetricResult ExternalFramework::ParseMetricValue(const string& framework_name,
                                                 const string& value) {
  size_t position = value.find('|');
  string score_field = boost::algorithm::trim_copy(value.substr(0, position));
  boost::optional<string> details;
  if (position != string::npos) {
    details = boost::algorithm::trim_copy(value.substr(position + 1));
  }

  if (score_field == FAILED_SCORE) {
    return MetricResult::Missing(
        "Evaluation failed: " + (details ? *details : "unknown error"));
  }
  if (score_field == MISSING_SCORE) {
    return MetricResult::Missing(
        details ? *details : "no score produced by " + framework_name);
  }

  double score;
  try {
    score = boost::lexical_cast<double>(score_field);
  } catch (const boost::bad_lexical_cast&) {
    throw ScoreServerError("malformed score: " + value);
  }
  if (!std::isfinite(score)) {
    throw ScoreServerError("malformed score: " + value);
  }
  if (!details) {
    return MetricResult(score, true);
  }

  // The reason is free text and may contain the field separator.
  size_t reason_start = details->find('|');
  string status = boost::algorithm::trim_copy(details->substr(0, reason_start));
  boost::optional<string> reason;
  if (reason_start != string::npos) {
    string text = boost::algorithm::trim_copy(
        details->substr(reason_start + 1));
    if (!text.empty()) {
      reason = text;
    }
  }
  if (status != PASSED_STATUS && status != FAILED_STATUS) {
    throw ScoreServerError("malformed score status: " + value);
  }
  return MetricResult(score, status == PASSED_STATUS, reason);
}

} // namespace frameworks
} // namespace evaluator
