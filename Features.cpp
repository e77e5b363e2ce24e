#include "Scoring.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace platewise {
namespace {
constexpr double kSurprisalCap = 20.0;
constexpr int kPositionBins = 10;

enum FeatureId {
  kTf,
  kPlateSolutionCount,
  kPlateDifficulty,
  kIdf,
  kWordPlateCount,
  kTfIdf,
  kSurprisal,
  kPositionalEntropy,
  kPatternDensity,
  kNonConsecutiveness,
  kPositionsSpread,
  kWordLength,
  kUniqueChars,
  kVowelCount,
  kConsonantCount,
  kVowelRatio,
  kConsonantRatio,
  kLogFrequency,
  kFeatureCount,
};

bool IsVowel(char c) {
  return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

double PositionalEntropy(const std::vector<int>& positions, size_t length) {
  if (positions.size() < 2 || length == 0) {
    return 0.0;
  }
  std::map<int, int> bins;
  for (int pos : positions) {
    double relative = static_cast<double>(pos) / static_cast<double>(length);
    for (int b = 0; b < kPositionBins; ++b) {
      double lo = b / static_cast<double>(kPositionBins);
      double hi = (b + 1) / static_cast<double>(kPositionBins);
      if (lo <= relative && relative <= hi) {
        bins[b]++;
        break;
      }
    }
  }
  int total = 0;
  for (const auto& kv : bins) {
    total += kv.second;
  }
  if (total == 0) {
    return 0.0;
  }
  double entropy = 0.0;
  for (const auto& kv : bins) {
    double p = static_cast<double>(kv.second) / total;
    entropy -= p * std::log2(p);
  }
  return entropy;
}
}  // namespace

FeatureExtractor::FeatureExtractor(std::shared_ptr<const CorpusIndex> index)
    : index_(std::move(index)) {}

const std::vector<std::string>& FeatureExtractor::FeatureNames() {
  static const std::vector<std::string> names = {
      "tf",
      "plate_solution_count",
      "plate_difficulty",
      "idf",
      "word_plate_count",
      "tf_idf",
      "surprisal",
      "positional_entropy",
      "pattern_density",
      "non_consecutiveness",
      "positions_spread",
      "word_length",
      "unique_chars",
      "vowel_count",
      "consonant_count",
      "vowel_ratio",
      "consonant_ratio",
      "log_frequency",
  };
  return names;
}

std::vector<int> FeatureExtractor::SubsequencePositions(
    std::string_view pattern,
    std::string_view word) {
  std::vector<int> positions;
  size_t cursor = 0;
  for (size_t i = 0; i < word.size() && cursor < pattern.size(); ++i) {
    if (word[i] == pattern[cursor]) {
      positions.push_back(static_cast<int>(i));
      ++cursor;
    }
  }
  if (cursor != pattern.size()) {
    positions.clear();
  }
  return positions;
}

bool FeatureExtractor::Extract(std::string_view word,
                               std::string_view pattern,
                               Eigen::VectorXd* out,
                               ScoreStatus* status) const {
  auto set_status = [status](ScoreStatus value) {
    if (status) {
      *status = value;
    }
  };
  std::string normalized_word;
  std::string normalized_pattern;
  if (!out || !index_ || !Corpus::NormalizeWord(word, &normalized_word) ||
      !Corpus::NormalizePattern(pattern, MatchMode::kSubsequence,
                                &normalized_pattern)) {
    set_status(ScoreStatus::kInvalidInput);
    return false;
  }
  size_t pattern_id = 0;
  if (!index_->FindPattern(normalized_pattern, &pattern_id)) {
    set_status(ScoreStatus::kUncoveredPattern);
    return false;
  }

  const Corpus& corpus = index_->corpus();
  size_t word_index = 0;
  const bool known = corpus.Find(normalized_word, &word_index);
  const bool solution = known && index_->IsSolution(pattern_id, word_index);
  const size_t plate_solutions = index_->SolutionsFor(pattern_id).size();
  const size_t word_plates = known ? index_->PatternsFor(word_index).size() : 0;
  const double total_plates = static_cast<double>(index_->pattern_count());

  Eigen::VectorXd features = Eigen::VectorXd::Zero(kFeatureCount);
  features[kTf] = solution ? 1.0 : 0.0;
  features[kPlateSolutionCount] = static_cast<double>(plate_solutions);
  features[kPlateDifficulty] =
      1.0 / static_cast<double>(std::max<size_t>(plate_solutions, 1));
  if (word_plates > 0) {
    features[kIdf] = std::log(total_plates / static_cast<double>(word_plates));
  } else if (total_plates > 0.0) {
    features[kIdf] = std::log(total_plates);
  }
  features[kWordPlateCount] = static_cast<double>(word_plates);
  features[kTfIdf] = features[kTf] * features[kIdf];
  features[kSurprisal] =
      (solution && plate_solutions > 0)
          ? -std::log(1.0 / static_cast<double>(plate_solutions))
          : kSurprisalCap;

  const size_t length = normalized_word.size();
  const std::vector<int> positions =
      SubsequencePositions(normalized_pattern, normalized_word);
  if (!positions.empty()) {
    features[kPositionalEntropy] = PositionalEntropy(positions, length);
    features[kPatternDensity] = static_cast<double>(normalized_pattern.size()) /
                                static_cast<double>(length);
    if (positions.size() > 1) {
      int gaps = 0;
      for (size_t i = 1; i < positions.size(); ++i) {
        gaps += positions[i] - positions[i - 1] - 1;
      }
      features[kNonConsecutiveness] =
          static_cast<double>(gaps) / static_cast<double>(length);
      features[kPositionsSpread] =
          static_cast<double>(positions.back() - positions.front()) /
          static_cast<double>(length);
    }
  }

  std::set<char> unique(normalized_word.begin(), normalized_word.end());
  int vowels = 0;
  for (char c : normalized_word) {
    if (IsVowel(c)) {
      ++vowels;
    }
  }
  const int consonants = static_cast<int>(length) - vowels;
  features[kWordLength] = static_cast<double>(length);
  features[kUniqueChars] = static_cast<double>(unique.size());
  features[kVowelCount] = vowels;
  features[kConsonantCount] = consonants;
  features[kVowelRatio] = static_cast<double>(vowels) / length;
  features[kConsonantRatio] = static_cast<double>(consonants) / length;
  const uint64_t frequency = known ? corpus.entry(word_index).frequency : 0;
  features[kLogFrequency] = std::log(static_cast<double>(frequency) + 1.0);

  *out = std::move(features);
  set_status(ScoreStatus::kOk);
  return true;
}

}  // namespace platewise
