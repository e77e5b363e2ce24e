#include "Scoring.hpp"

#include <algorithm>
#include <cmath>

namespace platewise {
namespace {
constexpr double kInverseWeight = 0.4;
constexpr double kPercentileWeight = 0.4;
constexpr double kZScoreWeight = 0.2;
constexpr double kZScoreRange = 3.0;
constexpr double kBelowAllThresholds = 99.9;

struct RarityComponents {
  double log_frequency = 0.0;
  double inverse = 0.0;
  double percentile = 0.0;
  double z_score = 0.0;
  double z_rarity = 0.0;
  double combined = 0.0;
};

double Clamp100(double value) {
  return std::max(0.0, std::min(100.0, value));
}

RarityComponents ComputeRarity(const FrequencyStats& stats,
                               uint64_t frequency) {
  RarityComponents out;
  out.log_frequency = std::log(static_cast<double>(frequency) + 1.0);

  if (stats.max_log_frequency > 0.0) {
    out.inverse = Clamp100((stats.max_log_frequency - out.log_frequency) /
                           stats.max_log_frequency * 100.0);
  }

  out.percentile = kBelowAllThresholds;
  for (size_t k = kPercentileCount; k-- > 0;) {
    if (frequency >= stats.percentile_thresholds[k]) {
      out.percentile = 100.0 - kRarityPercentiles[k];
      break;
    }
  }

  if (stats.std_log_frequency > 0.0) {
    out.z_score =
        (stats.mean_log_frequency - out.log_frequency) / stats.std_log_frequency;
  }
  out.z_rarity =
      Clamp100((out.z_score + kZScoreRange) / (2.0 * kZScoreRange) * 100.0);

  out.combined = Clamp100(kInverseWeight * out.inverse +
                          kPercentileWeight * out.percentile +
                          kZScoreWeight * out.z_rarity);
  return out;
}

std::string InterpretFrequency(double score) {
  if (score >= 90.0) {
    return "extremely rare";
  }
  if (score >= 80.0) {
    return "very rare";
  }
  if (score >= 60.0) {
    return "uncommon";
  }
  if (score >= 40.0) {
    return "moderately common";
  }
  if (score >= 20.0) {
    return "common";
  }
  return "very common";
}
}  // namespace

ScoreResult ScoreFrequency(const Corpus& corpus, std::string_view word) {
  ScoreResult result;
  result.dimension = kFrequencyDimension;

  std::string normalized;
  if (!Corpus::NormalizeWord(word, &normalized)) {
    result.status = ScoreStatus::kInvalidInput;
    result.error = "word must be non-empty and contain only letters";
    return result;
  }
  size_t index = 0;
  if (!corpus.Find(normalized, &index) ||
      corpus.entry(index).frequency == 0) {
    result.status = ScoreStatus::kNotFound;
    result.error = "word not found in corpus: " + normalized;
    return result;
  }

  const uint64_t frequency = corpus.entry(index).frequency;
  const RarityComponents rarity = ComputeRarity(corpus.stats(), frequency);

  result.score = rarity.combined;
  result.metrics = {
      {"frequency", static_cast<double>(frequency)},
      {"log_frequency", rarity.log_frequency},
      {"z_score", rarity.z_score},
      {"inverse_frequency_score", rarity.inverse},
      {"percentile_rarity_score", rarity.percentile},
      {"zscore_rarity_score", rarity.z_rarity},
      {"frequency_rank", static_cast<double>(corpus.FrequencyRank(frequency))},
      {"corpus_size", static_cast<double>(corpus.size())},
  };
  result.interpretation = InterpretFrequency(rarity.combined);
  return result;
}

std::vector<RareWord> RarestWords(const Corpus& corpus, size_t limit) {
  std::vector<size_t> order;
  order.reserve(corpus.size());
  for (size_t i = 0; i < corpus.size(); ++i) {
    if (corpus.entry(i).frequency > 0) {
      order.push_back(i);
    }
  }
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return corpus.entry(a).frequency < corpus.entry(b).frequency;
  });
  if (order.size() > limit) {
    order.resize(limit);
  }

  std::vector<RareWord> out;
  out.reserve(order.size());
  for (size_t i : order) {
    const Corpus::Entry& entry = corpus.entry(i);
    RarityComponents rarity = ComputeRarity(corpus.stats(), entry.frequency);
    out.push_back({entry.word, entry.frequency, rarity.combined,
                   rarity.percentile});
  }
  return out;
}

}  // namespace platewise
