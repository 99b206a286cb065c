#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>
#if HAVE_OPEN_MP
#include <omp.h>
#else
  const unsigned omp_get_num_threads() { return 1; }
#endif

#include "evaluation_context.h"
#include "framework_registry.h"
#include "metric_result.h"
#include "orchestrator.h"
#include "time_util.h"
#include "verbosity.h"

namespace po = boost::program_options;
using namespace std;
using namespace evaluator;

// Reads question<TAB>answer[<TAB>expected[<TAB>context[<TAB>category]]]
// lines. Missing or empty trailing fields are left out of the context.
vector<EvaluationContext> ReadContexts(istream& input) {
  vector<EvaluationContext> contexts;
  string line;
  while (getline(input, line)) {
    if (!line.empty() && line[line.size() - 1] == '\r') {
      line.erase(line.size() - 1);
    }
    vector<string> fields;
    boost::algorithm::split(fields, line, boost::algorithm::is_any_of("\t"));
    fields.resize(5);

    boost::optional<string> expected_answer, context, category;
    if (!fields[2].empty()) expected_answer = fields[2];
    if (!fields[3].empty()) context = fields[3];
    if (!fields[4].empty()) category = fields[4];
    contexts.push_back(EvaluationContext(
        fields[0], fields[1], context, expected_answer, category));
  }
  return contexts;
}

string FormatScores(const AggregatedResult& result) {
  ostringstream scores, errors;
  for (const auto& framework: result.framework_scores) {
    if (framework.second.IsError()) {
      errors << ' ' << framework.first << ": " << framework.second.GetError();
      continue;
    }
    for (const auto& metric: framework.second.GetMetrics()) {
      scores << framework.first << '.' << metric.first << '=';
      if (metric.second.score) {
        scores << *metric.second.score;
      } else {
        scores << "NA";
      }
      scores << ' ';
    }
  }

  string output = boost::algorithm::trim_copy(scores.str());
  if (!errors.str().empty()) {
    output += " ||| errors:" + errors.str();
  }
  return output;
}

int main(int argc, char** argv) {
  int max_threads = 1;
  #pragma omp parallel
  max_threads = omp_get_num_threads();
  string threads_option = "Maximum number of parallel tasks, 0 meaning one "
                          "per task (max=" + to_string(max_threads) + ")";
  po::options_description desc("Command line options");
  desc.add_options()
    ("help,h", "Show available options")
    ("config,c", po::value<string>(), "Configuration file")
    ("threads,t", po::value<int>()->default_value(0), threads_option.c_str())
    ("batch_size,b", po::value<size_t>()->default_value(
        Orchestrator::DEFAULT_BATCH_SIZE),
        "Number of items evaluated concurrently")
    ("metrics,m", po::value<string>()->default_value(""),
        "Comma separated list of metrics (default: all applicable)")
    ("external,x", po::value<vector<string> >()->composing(),
        "External framework served by a score server, given as "
        "NAME[:TIMEOUT_MS]=COMMAND (repeatable)")
    ("score_server_timeout", po::value<int>()->default_value(
        ExternalFrameworkConfig::DEFAULT_TIMEOUT_MS),
        "Default score server response timeout in milliseconds (0 = none)")
    ("quiet,q", "Only report warnings and errors");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if (vm.count("help")) {
      cout << desc << endl;
      return 0;
    }

    if (vm.count("config")) {
      ifstream config_stream(vm["config"].as<string>());
      if (!config_stream) {
        cerr << "Unable to open configuration file "
             << vm["config"].as<string>() << endl;
        return 1;
      }
      po::store(po::parse_config_file(config_stream, desc), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    cerr << e.what() << endl << desc << endl;
    return 1;
  }

  SetVerbose(!vm.count("quiet"));


  MetricSelection selection;
  string metrics = vm["metrics"].as<string>();
  if (!metrics.empty()) {
    boost::algorithm::split(selection, metrics,
                            boost::algorithm::is_any_of(","));
    for (string& metric: selection) {
      boost::algorithm::trim(metric);
    }
  }

  shared_ptr<FrameworkRegistry> registry;
  try {
    RegistryConfig config;
    if (vm.count("external")) {
      for (const string& description: vm["external"].as<vector<string> >()) {
        config.external_frameworks.push_back(ExternalFrameworkConfig::Parse(
            description, vm["score_server_timeout"].as<int>()));
      }
    }
    registry = FrameworkRegistry::Create(config);
  } catch (const exception& e) {
    cerr << "Invalid configuration: " << e.what() << endl;
    return 1;
  }
  Orchestrator orchestrator(registry, vm["threads"].as<int>());

  Clock::time_point start_time = Clock::now();
  if (IsVerbose()) {
    cerr << "Reading evaluation contexts..." << endl;
  }
  vector<EvaluationContext> contexts = ReadContexts(cin);

  vector<BulkItemResult> results;
  try {
    results = orchestrator.EvaluateBulk(
        contexts, selection, vm["batch_size"].as<size_t>());
  } catch (const exception& e) {
    cerr << "Evaluation failed: " << e.what() << endl;
    return 1;
  }

  for (const BulkItemResult& item: results) {
    cout << item.index << " ||| " << GetStatusName(item.status) << " ||| ";
    if (item.status == COMPLETED) {
      cout << FormatScores(item.evaluation.result);
    } else {
      cout << item.error;
    }
    cout << endl;
  }

  if (IsVerbose()) {
    cerr << "Overall evaluation took "
         << GetDuration(start_time, Clock::now()) << " seconds" << endl;
  }
  return 0;
}
