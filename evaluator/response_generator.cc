#include "response_generator.h"

#include <cmath>

namespace evaluator {

ResponseGenerator::~ResponseGenerator() {}

PricingTable::PricingTable() {
  prices = {
    {"openai/gpt-4", {0.03, 0.06}},
    {"openai/gpt-3.5-turbo", {0.001, 0.002}},
    {"anthropic/claude-3-opus", {0.015, 0.075}},
    {"anthropic/claude-3-sonnet", {0.003, 0.015}},
    {"google/gemini-pro", {0.0005, 0.0015}}
  };
}

PricingTable::PricingTable(const map<string, Price>& prices) :
    prices(prices) {}

boost::optional<double> PricingTable::EstimateCost(
    const string& model, int prompt_tokens, int completion_tokens) const {
  auto it = prices.find(model);
  if (it == prices.end()) {
    return boost::none;
  }
  double cost = prompt_tokens / 1000.0 * it->second.prompt +
                completion_tokens / 1000.0 * it->second.completion;
  return round(cost * 1e6) / 1e6;
}

} // namespace evaluator
