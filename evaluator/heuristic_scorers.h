#ifndef _HEURISTIC_SCORERS_H_
#define _HEURISTIC_SCORERS_H_

#include <string>

using namespace std;

namespace evaluator {

// Approximates METEOR with unigram-set matching: the recall-weighted F-mean
// of precision and recall, reduced by a fragmentation penalty that ignores
// chunking.
double MeteorApprox(const string& candidate, const string& reference);

// Scores the internal consistency of the text from its capitalized entity
// mentions, the use of discourse connectors and the variation of the
// sentence lengths. A single sentence scores 0.8.
double Coherence(const string& text);

// Token overlap of the answer with the question, blended with the overlap
// with the context if a non-empty context is given.
double Relevance(const string& question, const string& answer,
                 const string& context = "");

// Combines the closeness of the average sentence length to 15 tokens, the
// closeness of the function word ratio to 0.3 and the punctuation per
// sentence.
double Fluency(const string& text);

// 0.6 * vocabulary richness + 0.4 * content word ratio.
double Informativeness(const string& text);

double LengthRatio(const string& candidate, const string& reference);

// Jaccard index of the token sets.
double WordOverlap(const string& candidate, const string& reference);

// Average over the candidate sentences of the best Jaccard index against any
// reference sentence.
double SentenceSimilarity(const string& candidate, const string& reference);

} // namespace evaluator

#endif
