#include "ngram_metrics.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include "tokenizer.h"

namespace evaluator {

namespace {

const int BLEU_MAX_ORDER = 4;

RougeScore SetOverlapScore(const vector<NGram>& candidate,
                           const vector<NGram>& reference) {
  set<NGram> candidate_set(candidate.begin(), candidate.end());
  set<NGram> reference_set(reference.begin(), reference.end());
  if (candidate_set.empty() || reference_set.empty()) {
    return RougeScore();
  }

  int overlap = 0;
  for (const NGram& ngram: candidate_set) {
    overlap += reference_set.count(ngram);
  }
  return RougeScore(static_cast<double>(overlap) / candidate_set.size(),
                    static_cast<double>(overlap) / reference_set.size());
}

// Clipped precision of the candidate n-grams of the given order.
double ClippedPrecision(const vector<string>& candidate,
                        const vector<string>& reference, int n) {
  vector<NGram> candidate_ngrams = NGrams(candidate, n);
  if (candidate_ngrams.empty()) {
    return 0;
  }

  map<NGram, int> candidate_counts, reference_counts;
  for (const NGram& ngram: candidate_ngrams) {
    ++candidate_counts[ngram];
  }
  for (const NGram& ngram: NGrams(reference, n)) {
    ++reference_counts[ngram];
  }

  int matches = 0;
  for (const auto& entry: candidate_counts) {
    auto it = reference_counts.find(entry.first);
    if (it != reference_counts.end()) {
      matches += min(entry.second, it->second);
    }
  }
  return static_cast<double>(matches) / candidate_ngrams.size();
}

} // namespace

RougeScore::RougeScore(double precision, double recall) :
    precision(precision), recall(recall), f1(0) {
  if (precision + recall > 0) {
    f1 = 2 * precision * recall / (precision + recall);
  }
}

vector<NGram> NGrams(const vector<string>& tokens, int n) {
  vector<NGram> ngrams;
  if (n <= 0 || tokens.size() < static_cast<size_t>(n)) {
    return ngrams;
  }
  for (size_t i = 0; i + n <= tokens.size(); ++i) {
    ngrams.push_back(NGram(tokens.begin() + i, tokens.begin() + i + n));
  }
  return ngrams;
}

int LcsLength(const vector<string>& a, const vector<string>& b) {
  // Only the previous row of the dynamic programming table is kept.
  vector<int> previous(b.size() + 1, 0), current(b.size() + 1, 0);
  for (size_t i = 1; i <= a.size(); ++i) {
    for (size_t j = 1; j <= b.size(); ++j) {
      if (a[i - 1] == b[j - 1]) {
        current[j] = previous[j - 1] + 1;
      } else {
        current[j] = max(previous[j], current[j - 1]);
      }
    }
    previous.swap(current);
  }
  return previous[b.size()];
}

RougeScores ComputeRouge(const string& candidate, const string& reference) {
  RougeScores scores;
  vector<string> candidate_tokens = Tokenize(candidate);
  vector<string> reference_tokens = Tokenize(reference);
  if (candidate_tokens.empty() || reference_tokens.empty()) {
    return scores;
  }

  scores.rouge1 = SetOverlapScore(NGrams(candidate_tokens, 1),
                                  NGrams(reference_tokens, 1));
  if (candidate_tokens.size() < 2 && candidate_tokens == reference_tokens) {
    // Identical single token texts have no bigrams but match perfectly.
    scores.rouge2 = RougeScore(1, 1);
  } else {
    scores.rouge2 = SetOverlapScore(NGrams(candidate_tokens, 2),
                                    NGrams(reference_tokens, 2));
  }

  int lcs = LcsLength(candidate_tokens, reference_tokens);
  scores.rougeL = RougeScore(
      static_cast<double>(lcs) / candidate_tokens.size(),
      static_cast<double>(lcs) / reference_tokens.size());
  return scores;
}

double ComputeBleu(const string& candidate, const string& reference) {
  vector<string> candidate_tokens = Tokenize(candidate);
  vector<string> reference_tokens = Tokenize(reference);
  if (candidate_tokens.empty() || reference_tokens.empty()) {
    return 0;
  }

  double log_bleu = 0;
  for (int n = 1; n <= BLEU_MAX_ORDER; ++n) {
    double precision = ClippedPrecision(candidate_tokens, reference_tokens, n);
    if (precision <= 0) {
      return 0;
    }
    log_bleu += log(precision) / BLEU_MAX_ORDER;
  }

  double brevity_penalty = min(1.0, exp(
      1.0 - static_cast<double>(reference_tokens.size()) /
            candidate_tokens.size()));
  return brevity_penalty * exp(log_bleu);
}

} // namespace evaluator
