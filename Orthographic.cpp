#include "Scoring.hpp"

#include <algorithm>
#include <cmath>

namespace platewise {
namespace {
constexpr double kBigramMinBits = 6.0;
constexpr double kBigramMaxBits = 12.0;
constexpr double kTrigramMinBits = 7.0;
constexpr double kTrigramMaxBits = 18.0;
constexpr double kBigramWeight = 0.4;
constexpr double kTrigramWeight = 0.6;

using CountTable = std::unordered_map<std::string, double>;

void CountNGrams(const std::string& padded,
                 size_t order,
                 double weight,
                 CountTable* counts,
                 double* total) {
  if (padded.size() < order) {
    return;
  }
  for (size_t i = 0; i + order <= padded.size(); ++i) {
    (*counts)[padded.substr(i, order)] += weight;
    *total += weight;
  }
}

double Normalize(const CountTable& counts,
                 double total,
                 std::unordered_map<std::string, double>* probs) {
  double entropy = 0.0;
  if (total <= 0.0) {
    return entropy;
  }
  probs->reserve(counts.size());
  for (const auto& kv : counts) {
    double p = kv.second / total;
    (*probs)[kv.first] = p;
    if (p > 0.0) {
      entropy -= p * std::log2(p);
    }
  }
  return entropy;
}

std::vector<std::pair<std::string, double>> TopCounts(
    const CountTable& counts,
    size_t limit) {
  std::vector<std::pair<std::string, double>> out(counts.begin(),
                                                    counts.end());
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.second != b.second) {
      return a.second > b.second;
    }
    return a.first < b.first;
  });
  if (out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

double Rescale(double bits, double lo, double hi) {
  double scaled = (bits - lo) / (hi - lo) * 100.0;
  return std::max(0.0, std::min(100.0, scaled));
}

std::string InterpretOrthographic(double score) {
  if (score >= 85.0) {
    return "extremely high complexity";
  }
  if (score >= 70.0) {
    return "high complexity";
  }
  if (score >= 50.0) {
    return "moderate complexity";
  }
  if (score >= 30.0) {
    return "low complexity";
  }
  return "very low complexity";
}

std::vector<NGramSurprisal> Surprisals(const NGramModel& model,
                                       const std::string& padded,
                                       size_t order) {
  std::vector<NGramSurprisal> out;
  if (padded.size() < order) {
    return out;
  }
  out.reserve(padded.size() - order + 1);
  for (size_t i = 0; i + order <= padded.size(); ++i) {
    NGramSurprisal item;
    item.ngram = padded.substr(i, order);
    item.bits = -std::log2(model.Probability(item.ngram));
    out.push_back(std::move(item));
  }
  return out;
}

double Total(const std::vector<NGramSurprisal>& items) {
  double total = 0.0;
  for (const NGramSurprisal& item : items) {
    total += item.bits;
  }
  return total;
}
}  // namespace

std::string NGramModel::Pad(std::string_view word) {
  std::string padded;
  padded.reserve(word.size() + 2);
  padded.push_back(kStartMarker);
  padded.append(word.data(), word.size());
  padded.push_back(kEndMarker);
  return padded;
}

std::shared_ptr<const NGramModel> NGramModel::Build(const Corpus& corpus) {
  std::shared_ptr<NGramModel> model(new NGramModel());
  CountTable bigrams;
  CountTable trigrams;
  double total_bigrams = 0.0;
  double total_trigrams = 0.0;

  for (const Corpus::Entry& entry : corpus.entries()) {
    if (entry.frequency == 0) {
      continue;
    }
    const std::string padded = Pad(entry.word);
    const double weight = static_cast<double>(entry.frequency);
    CountNGrams(padded, 2, weight, &bigrams, &total_bigrams);
    CountNGrams(padded, 3, weight, &trigrams, &total_trigrams);
  }

  Stats& stats = model->stats_;
  stats.corpus_words = corpus.size();
  stats.unique_bigrams = bigrams.size();
  stats.unique_trigrams = trigrams.size();
  stats.total_bigrams = total_bigrams;
  stats.total_trigrams = total_trigrams;
  stats.bigram_entropy =
      Normalize(bigrams, total_bigrams, &model->bigram_probs_);
  stats.trigram_entropy =
      Normalize(trigrams, total_trigrams, &model->trigram_probs_);
  stats.top_bigrams = TopCounts(bigrams, kTopNGrams);
  stats.top_trigrams = TopCounts(trigrams, kTopNGrams);
  return model;
}

double NGramModel::BigramProbability(std::string_view bigram) const {
  auto it = bigram_probs_.find(std::string(bigram));
  return it == bigram_probs_.end() ? kUnseenProbability : it->second;
}

double NGramModel::TrigramProbability(std::string_view trigram) const {
  auto it = trigram_probs_.find(std::string(trigram));
  return it == trigram_probs_.end() ? kUnseenProbability : it->second;
}

double NGramModel::Probability(std::string_view ngram) const {
  switch (ngram.size()) {
    case 2:
      return BigramProbability(ngram);
    case 3:
      return TrigramProbability(ngram);
    default:
      return kUnseenProbability;
  }
}

ScoreResult ScoreOrthographic(const NGramModel& model, std::string_view word) {
  ScoreResult result;
  result.dimension = kOrthographicDimension;

  std::string normalized;
  if (!Corpus::NormalizeWord(word, &normalized)) {
    result.status = ScoreStatus::kInvalidInput;
    result.error = "word must be non-empty and contain only letters";
    return result;
  }

  const std::string padded = NGramModel::Pad(normalized);
  const std::vector<NGramSurprisal> bigrams = Surprisals(model, padded, 2);
  const std::vector<NGramSurprisal> trigrams = Surprisals(model, padded, 3);
  const double bigram_total = Total(bigrams);
  const double trigram_total = Total(trigrams);
  const double bigram_avg =
      bigrams.empty() ? 0.0 : bigram_total / static_cast<double>(bigrams.size());
  const double trigram_avg =
      trigrams.empty() ? 0.0
                       : trigram_total / static_cast<double>(trigrams.size());

  const double bigram_score =
      bigrams.empty() ? 0.0 : Rescale(bigram_avg, kBigramMinBits, kBigramMaxBits);
  const double trigram_score =
      trigrams.empty() ? 0.0
                       : Rescale(trigram_avg, kTrigramMinBits, kTrigramMaxBits);
  const double combined =
      kBigramWeight * bigram_score + kTrigramWeight * trigram_score;

  result.score = combined;
  result.metrics = {
      {"avg_bigram_surprisal", bigram_avg},
      {"avg_trigram_surprisal", trigram_avg},
      {"total_bigram_surprisal", bigram_total},
      {"total_trigram_surprisal", trigram_total},
      {"bigram_count", static_cast<double>(bigrams.size())},
      {"trigram_count", static_cast<double>(trigrams.size())},
      {"bigram_score", bigram_score},
      {"trigram_score", trigram_score},
      {"word_length", static_cast<double>(normalized.size())},
  };
  result.interpretation = InterpretOrthographic(combined);
  return result;
}

std::vector<NGramSurprisal> OrthographicDetails(const NGramModel& model,
                                                std::string_view word,
                                                size_t order) {
  std::string normalized;
  if ((order != 2 && order != 3) ||
      !Corpus::NormalizeWord(word, &normalized)) {
    return {};
  }
  return Surprisals(model, NGramModel::Pad(normalized), order);
}

}  // namespace platewise
