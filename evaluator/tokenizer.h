#ifndef _TOKENIZER_H_
#define _TOKENIZER_H_

#include <set>
#include <string>
#include <vector>

using namespace std;

namespace evaluator {

// Lower-cases the text and returns its runs of word characters (letters,
// digits and underscores) in order. Punctuation and whitespace separate
// tokens.
vector<string> Tokenize(const string& text);

// Returns the distinct tokens of the text.
set<string> TokenSet(const string& text);

// Splits the text on runs of sentence terminators (. ! ?) and returns the
// trimmed, non-empty pieces.
vector<string> SplitSentences(const string& text);

} // namespace evaluator

#endif
