#ifndef _FRAMEWORK_REGISTRY_H_
#define _FRAMEWORK_REGISTRY_H_

#include <memory>
#include <string>
#include <vector>

using namespace std;

namespace evaluator {

namespace frameworks {
  class Framework;
} // namespace frameworks

/**
 * External framework served by a score server child process.
 */
struct ExternalFrameworkConfig {
  ExternalFrameworkConfig() : timeout_ms(DEFAULT_TIMEOUT_MS) {}

  ExternalFrameworkConfig(const string& name, const string& command,
                          int timeout_ms = DEFAULT_TIMEOUT_MS) :
      name(name), command(command), timeout_ms(timeout_ms) {}

  // Parses NAME[:TIMEOUT_MS]=COMMAND. Throws invalid_argument if the
  // description is malformed.
  static ExternalFrameworkConfig Parse(const string& description,
                                       int default_timeout_ms);

  string name;
  // Shell command starting the score server.
  string command;
  // 0 waits forever.
  int timeout_ms;

  static const int DEFAULT_TIMEOUT_MS;
};

/**
 * Frameworks registered at start-up. The basic framework is always
 * registered, every external framework listed here is enabled on its own.
 */
struct RegistryConfig {
  vector<ExternalFrameworkConfig> external_frameworks;
};

/**
 * Named set of frameworks. It is filled once when constructed and only read
 * afterwards, so it can be shared by concurrent evaluations.
 */
class FrameworkRegistry {
 public:
  // Throws invalid_argument if two frameworks have the same name.
  FrameworkRegistry(
      const vector<shared_ptr<frameworks::Framework> >& frameworks);

  virtual ~FrameworkRegistry();

  // Builds the registry enabled by the configuration. An external framework
  // that cannot be started is reported and left out. Throws invalid_argument
  // if an external framework has no name or no command.
  static shared_ptr<FrameworkRegistry> Create(const RegistryConfig& config);

  const vector<shared_ptr<frameworks::Framework> >& GetFrameworks() const {
    return frameworks;
  }

  // Returns null if no framework has the given name.
  shared_ptr<frameworks::Framework> GetFramework(const string& name) const;

  vector<string> GetFrameworkNames() const;

  size_t size() const { return frameworks.size(); }

 private:
  vector<shared_ptr<frameworks::Framework> > frameworks;
};

} // namespace evaluator

#endif
