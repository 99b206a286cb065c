#include "framework_registry.h"

#include <iostream>
#include <set>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "evaluation_error.h"
#include "frameworks/basic_framework.h"
#include "frameworks/external_framework.h"
#include "frameworks/framework.h"
#include "frameworks/score_server.h"
#include "metrics_engine.h"
#include "verbosity.h"

namespace evaluator {

const int ExternalFrameworkConfig::DEFAULT_TIMEOUT_MS = 30000;

ExternalFrameworkConfig ExternalFrameworkConfig::Parse(
    const string& description, int default_timeout_ms) {
  size_t position = description.find('=');
  if (position == string::npos) {
    throw invalid_argument("Expected NAME[:TIMEOUT_MS]=COMMAND: " +
                           description);
  }
  string name = boost::algorithm::trim_copy(description.substr(0, position));
  string command =
      boost::algorithm::trim_copy(description.substr(position + 1));

  int timeout_ms = default_timeout_ms;
  size_t timeout_start = name.find(':');
  if (timeout_start != string::npos) {
    try {
      timeout_ms = boost::lexical_cast<int>(name.substr(timeout_start + 1));
    } catch (const boost::bad_lexical_cast&) {
      throw invalid_argument("Invalid score server timeout: " + description);
    }
    name = name.substr(0, timeout_start);
  }
  if (name.empty() || command.empty() || timeout_ms < 0) {
    throw invalid_argument("Expected NAME[:TIMEOUT_MS]=COMMAND: " +
                           description);
  }
  return ExternalFrameworkConfig(name, command, timeout_ms);
}

FrameworkRegistry::FrameworkRegistry(
    const vector<shared_ptr<frameworks::Framework> >& frameworks) :
    frameworks(frameworks) {
  set<string> names;
  for (auto framework: frameworks) {
    if (!names.insert(framework->GetName()).second) {
      throw invalid_argument("Duplicate framework: " + framework->GetName());
    }
  }
}

FrameworkRegistry::~FrameworkRegistry() {}

shared_ptr<FrameworkRegistry> FrameworkRegistry::Create(
    const RegistryConfig& config) {
  vector<shared_ptr<frameworks::Framework> > enabled = {
      make_shared<frameworks::BasicFramework>(make_shared<MetricsEngine>())
  };

  for (const ExternalFrameworkConfig& external: config.external_frameworks) {
    if (external.name.empty() || external.command.empty()) {
      throw invalid_argument(
          "An external framework needs a name and a score server command");
    }
    try {
      shared_ptr<frameworks::ScoreServer> server =
          make_shared<frameworks::ScoreServer>(
              external.command, external.timeout_ms);
      enabled.push_back(make_shared<frameworks::ExternalFramework>(
          external.name, server));
    } catch (const ScoreServerError& e) {
      cerr << "Unable to load framework " << external.name << ": "
           << e.what() << endl;
    }
  }

  shared_ptr<FrameworkRegistry> registry =
      make_shared<FrameworkRegistry>(enabled);
  if (IsVerbose()) {
    cerr << "Loaded frameworks: "
         << boost::algorithm::join(registry->GetFrameworkNames(), ", ")
         << endl;
  }
  return registry;
}

shared_ptr<frameworks::Framework> FrameworkRegistry::GetFramework(
    const string& name) const {
  for (auto framework: frameworks) {
    if (framework->GetName() == name) {
      return framework;
    }
  }
  return shared_ptr<frameworks::Framework>();
}

vector<string> FrameworkRegistry::GetFrameworkNames() const {
  vector<string> names;
  for (auto framework: frameworks) {
    names.push_back(framework->GetName());
  }
  return names;
}

} // namespace evaluator
