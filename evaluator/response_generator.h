#ifndef _RESPONSE_GENERATOR_H_
#define _RESPONSE_GENERATOR_H_

#include <map>
#include <string>

#include <boost/optional.hpp>

using namespace std;

namespace evaluator {

struct GenerationSettings {
  GenerationSettings() : temperature(0.7), max_tokens(2048), top_p(1.0) {}

  double temperature;
  int max_tokens;
  double top_p;
};

struct GenerationRequest {
  GenerationRequest(const string& model, const string& prompt,
                    const boost::optional<string>& context = boost::none,
                    const GenerationSettings& settings = GenerationSettings()) :
      model(model), prompt(prompt), context(context), settings(settings) {}

  string model;
  string prompt;
  // Sent as the system message when present.
  boost::optional<string> context;
  GenerationSettings settings;
};

struct GenerationResult {
  GenerationResult() :
      response_time(0), tokens_used(0), prompt_tokens(0),
      completion_tokens(0) {}

  string text;
  double response_time;
  int tokens_used;
  int prompt_tokens;
  int completion_tokens;
  boost::optional<double> cost;
};

/**
 * Interface to the service producing model responses (a chat completion
 * gateway). Implementations throw GenerationError when the provider or the
 * network fails.
 *
 * Generate() is called concurrently for different models of a comparison, so
 * implementations must be thread-safe.
 */
class ResponseGenerator {
 public:
  virtual ~ResponseGenerator();

  virtual GenerationResult Generate(const GenerationRequest& request) = 0;
};

/**
 * Prices per 1000 prompt and completion tokens, used to estimate the cost of
 * a generated response.
 */
class PricingTable {
 public:
  struct Price {
    double prompt;
    double completion;
  };

  // Creates the table with the default prices of the common models.
  PricingTable();

  PricingTable(const map<string, Price>& prices);

  // Returns the cost rounded to 6 decimals, or nothing for unknown models.
  boost::optional<double> EstimateCost(const string& model, int prompt_tokens,
                                       int completion_tokens) const;

 private:
  map<string, Price> prices;
};

} // namespace evaluator

#endif
