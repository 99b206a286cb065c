#include "heuristic_scorers.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>

#include "tokenizer.h"

namespace evaluator {

namespace {

const boost::regex ENTITY_PATTERN("\\b[A-Z][a-z]+\\b");

const vector<string> CONNECTORS = {
    "however", "therefore", "moreover", "furthermore", "additionally",
    "consequently", "meanwhile", "similarly", "in contrast", "as a result"
};

const set<string> FUNCTION_WORDS = {
    "the", "a", "an", "is", "are", "was", "were", "have", "has", "had"
};

const set<string> STOP_WORDS = {
    "the", "a", "an", "and", "or", "but", "in", "on", "at", "to", "for", "of",
    "with", "by", "is", "are", "was", "were", "be", "been", "being", "have",
    "has", "had", "do", "does", "did", "will", "would", "could", "should",
    "may", "might", "must", "can", "this", "that", "these", "those", "i",
    "you", "he", "she", "it", "we", "they", "me", "him", "her", "us", "them",
    "my", "your", "his", "its", "our", "their"
};

const double IDEAL_SENTENCE_LENGTH = 15;
const double IDEAL_FUNCTION_WORD_RATIO = 0.3;

double Clamp(double score) {
  return max(0.0, min(1.0, score));
}

size_t Intersection(const set<string>& a, const set<string>& b) {
  size_t count = 0;
  for (const string& token: a) {
    count += b.count(token);
  }
  return count;
}

double Jaccard(const set<string>& a, const set<string>& b) {
  size_t overlap = Intersection(a, b);
  size_t union_size = a.size() + b.size() - overlap;
  return union_size ? static_cast<double>(overlap) / union_size : 0;
}

} // namespace

double MeteorApprox(const string& candidate, const string& reference) {
  vector<string> candidate_tokens = Tokenize(candidate);
  vector<string> reference_tokens = Tokenize(reference);
  if (candidate_tokens.empty() || reference_tokens.empty()) {
    return 0;
  }

  set<string> candidate_set(candidate_tokens.begin(), candidate_tokens.end());
  set<string> reference_set(reference_tokens.begin(), reference_tokens.end());
  double matches = Intersection(candidate_set, reference_set);
  double precision = matches / candidate_set.size();
  double recall = matches / reference_set.size();
  if (precision + recall == 0) {
    return 0;
  }

  double f_mean = 10 * precision * recall / (9 * precision + recall);
  double penalty = 0.5 * matches / candidate_tokens.size();
  return Clamp(f_mean * (1 - penalty));
}

double Coherence(const string& text) {
  if (text.empty()) {
    return 0;
  }
  vector<string> sentences = SplitSentences(text);
  if (sentences.size() < 2) {
    return 0.8;
  }

  double score = 0;
  int factors = 0;

  vector<string> entities;
  boost::sregex_iterator it(text.begin(), text.end(), ENTITY_PATTERN), end;
  for (; it != end; ++it) {
    entities.push_back(it->str());
  }
  if (!entities.empty()) {
    set<string> distinct_entities(entities.begin(), entities.end());
    score += static_cast<double>(distinct_entities.size()) / entities.size();
    ++factors;
  }

  int connected_sentences = 0;
  for (const string& sentence: sentences) {
    string lowered = boost::algorithm::to_lower_copy(sentence);
    for (const string& connector: CONNECTORS) {
      if (lowered.find(connector) != string::npos) {
        ++connected_sentences;
        break;
      }
    }
  }
  score += min(1.0, static_cast<double>(connected_sentences) /
                    sentences.size());
  ++factors;

  vector<size_t> lengths;
  for (const string& sentence: sentences) {
    lengths.push_back(Tokenize(sentence).size());
  }
  double max_length = *max_element(lengths.begin(), lengths.end());
  double min_length = *min_element(lengths.begin(), lengths.end());
  score += 1 - (max_length - min_length) / (max_length + 1);
  ++factors;

  return Clamp(score / factors);
}

double Relevance(const string& question, const string& answer,
                 const string& context) {
  if (question.empty() || answer.empty()) {
    return 0;
  }

  set<string> question_tokens = TokenSet(question);
  set<string> answer_tokens = TokenSet(answer);
  double question_relevance = 0;
  if (!question_tokens.empty()) {
    question_relevance = static_cast<double>(
        Intersection(question_tokens, answer_tokens)) / question_tokens.size();
  }
  if (context.empty()) {
    return Clamp(question_relevance);
  }

  set<string> context_tokens = TokenSet(context);
  double context_relevance = 0;
  if (!context_tokens.empty()) {
    context_relevance = static_cast<double>(
        Intersection(context_tokens, answer_tokens)) / context_tokens.size();
  }
  return Clamp(0.7 * question_relevance + 0.3 * context_relevance);
}

double Fluency(const string& text) {
  if (text.empty()) {
    return 0;
  }

  double score = 0;
  int factors = 0;

  vector<string> sentences = SplitSentences(text);
  if (!sentences.empty()) {
    double total_length = 0;
    for (const string& sentence: sentences) {
      total_length += Tokenize(sentence).size();
    }
    double average_length = total_length / sentences.size();
    score += max(0.0, 1 - fabs(average_length - IDEAL_SENTENCE_LENGTH) / 20);
    ++factors;
  }

  vector<string> tokens = Tokenize(text);
  if (!tokens.empty()) {
    double function_words = count_if(tokens.begin(), tokens.end(),
        [](const string& token) { return FUNCTION_WORDS.count(token) > 0; });
    double ratio = function_words / tokens.size();
    score += max(0.0, 1 - fabs(ratio - IDEAL_FUNCTION_WORD_RATIO) /
                          IDEAL_FUNCTION_WORD_RATIO);
    ++factors;
  }

  if (!sentences.empty()) {
    double terminators = count_if(text.begin(), text.end(), [](char c) {
      return c == '.' || c == '!' || c == '?';
    });
    score += min(1.0, terminators / sentences.size());
    ++factors;
  }

  return factors ? Clamp(score / factors) : 0.5;
}

double Informativeness(const string& text) {
  vector<string> tokens = Tokenize(text);
  if (tokens.empty()) {
    return 0;
  }

  set<string> distinct(tokens.begin(), tokens.end());
  double richness = static_cast<double>(distinct.size()) / tokens.size();
  double content_words = count_if(tokens.begin(), tokens.end(),
      [](const string& token) { return STOP_WORDS.count(token) == 0; });
  double content_ratio = content_words / tokens.size();
  return Clamp(0.6 * richness + 0.4 * content_ratio);
}

double LengthRatio(const string& candidate, const string& reference) {
  double candidate_length = Tokenize(candidate).size();
  double reference_length = Tokenize(reference).size();
  if (reference_length == 0) {
    return candidate_length == 0 ? 1 : 0;
  }

  double ratio = candidate_length / reference_length;
  return Clamp(1 - fabs(1 - ratio) / max(1.0, ratio));
}

double WordOverlap(const string& candidate, const string& reference) {
  set<string> candidate_tokens = TokenSet(candidate);
  set<string> reference_tokens = TokenSet(reference);
  if (candidate_tokens.empty() && reference_tokens.empty()) {
    return 1;
  }
  if (candidate_tokens.empty() || reference_tokens.empty()) {
    return 0;
  }
  return Jaccard(candidate_tokens, reference_tokens);
}

double SentenceSimilarity(const string& candidate, const string& reference) {
  vector<string> candidate_sentences = SplitSentences(candidate);
  vector<string> reference_sentences = SplitSentences(reference);
  if (candidate_sentences.empty() || reference_sentences.empty()) {
    return 0;
  }

  vector<set<string>> reference_tokens;
  for (const string& sentence: reference_sentences) {
    reference_tokens.push_back(TokenSet(sentence));
  }

  double total = 0;
  for (const string& sentence: candidate_sentences) {
    set<string> candidate_tokens = TokenSet(sentence);
    double best = 0;
    for (const set<string>& tokens: reference_tokens) {
      if (!candidate_tokens.empty() && !tokens.empty()) {
        best = max(best, Jaccard(candidate_tokens, tokens));
      }
    }
    total += best;
  }
  return Clamp(total / candidate_sentences.size());
}

} // namespace evaluator
