#ifndef _NGRAM_METRICS_H_
#define _NGRAM_METRICS_H_

#include <string>
#include <vector>

using namespace std;

namespace evaluator {

typedef vector<string> NGram;

/**
 * Precision, recall and their harmonic mean for one ROUGE variant.
 */
struct RougeScore {
  RougeScore() : precision(0), recall(0), f1(0) {}
  RougeScore(double precision, double recall);

  double precision;
  double recall;
  double f1;
};

struct RougeScores {
  RougeScore rouge1;
  RougeScore rouge2;
  RougeScore rougeL;
};

// Returns every contiguous window of n tokens. The result is empty if the
// sequence is shorter than n.
vector<NGram> NGrams(const vector<string>& tokens, int n);

// Returns the length of the longest common subsequence of the token sequences.
int LcsLength(const vector<string>& a, const vector<string>& b);

// Computes ROUGE-1 and ROUGE-2 over the sets of unigrams and bigrams and
// ROUGE-L over the longest common subsequence. All scores are 0 if either
// text has no tokens.
RougeScores ComputeRouge(const string& candidate, const string& reference);

// Computes sentence level BLEU with clipped 1..4-gram precisions, uniform
// weights and the brevity penalty. There is no smoothing: if any order has
// no matching n-grams the score is 0.
double ComputeBleu(const string& candidate, const string& reference);

} // namespace evaluator

#endif
