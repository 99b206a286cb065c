#include "tokenizer.h"

#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>

namespace evaluator {

namespace {

const boost::regex WORD_PATTERN("\\w+");
const boost::regex SENTENCE_TERMINATORS("[.!?]+");

} // namespace

vector<string> Tokenize(const string& text) {
  vector<string> tokens;
  if (text.empty()) {
    return tokens;
  }

  string lowered = boost::algorithm::to_lower_copy(text);
  boost::sregex_iterator it(lowered.begin(), lowered.end(), WORD_PATTERN);
  boost::sregex_iterator end;
  for (; it != end; ++it) {
    tokens.push_back(it->str());
  }
  return tokens;
}

set<string> TokenSet(const string& text) {
  vector<string> tokens = Tokenize(text);
  return set<string>(tokens.begin(), tokens.end());
}

vector<string> SplitSentences(const string& text) {
  vector<string> sentences;
  boost::sregex_token_iterator it(text.begin(), text.end(),
                                  SENTENCE_TERMINATORS, -1);
  boost::sregex_token_iterator end;
  for (; it != end; ++it) {
    string sentence = boost::algorithm::trim_copy(it->str());
    if (!sentence.empty()) {
      sentences.push_back(sentence);
    }
  }
  return sentences;
}

} // namespace evaluator
