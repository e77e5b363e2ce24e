#include "Scoring.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace platewise {
namespace {
std::string InterpretInformation(double score) {
  if (score >= 80.0) {
    return "exceptional information";
  }
  if (score >= 60.0) {
    return "high information";
  }
  if (score >= 40.0) {
    return "moderate information";
  }
  if (score >= 20.0) {
    return "low information";
  }
  return "very predictable";
}

double PercentileInPattern(double bits, const PatternStats& stats) {
  const double avg = stats.avg_info_bits;
  const double max = stats.max_info_bits;
  if (max <= avg) {
    return 50.0;
  }
  if (bits >= max) {
    return 100.0;
  }
  if (bits <= avg) {
    return avg > 0.0 ? 50.0 * bits / avg : 0.0;
  }
  return 50.0 + 50.0 * (bits - avg) / (max - avg);
}
}  // namespace

ScoreResult ScoreInformation(const CorpusIndex& index,
                             std::string_view word,
                             std::string_view pattern) {
  ScoreResult result;
  result.dimension = kInformationDimension;

  std::string normalized_word;
  std::string normalized_pattern;
  if (!Corpus::NormalizeWord(word, &normalized_word)) {
    result.status = ScoreStatus::kInvalidInput;
    result.error = "word must be non-empty and contain only letters";
    return result;
  }
  if (!Corpus::NormalizePattern(pattern, MatchMode::kSubsequence,
                                &normalized_pattern)) {
    result.status = ScoreStatus::kInvalidInput;
    result.error = "plate must be " + std::to_string(kMinPatternLength) +
                   "-" + std::to_string(kMaxPatternLength) + " letters";
    return result;
  }

  size_t pattern_id = 0;
  if (!index.FindPattern(normalized_pattern, &pattern_id)) {
    result.status = ScoreStatus::kUncoveredPattern;
    result.error = "plate not covered by the index: " +
                   Corpus::DisplayPattern(normalized_pattern);
    return result;
  }

  const Corpus& corpus = index.corpus();
  size_t word_index = 0;
  if (!corpus.Find(normalized_word, &word_index) ||
      corpus.entry(word_index).frequency == 0) {
    result.status = ScoreStatus::kNotFound;
    result.error = "word not found in corpus: " + normalized_word;
    return result;
  }
  if (!index.IsSolution(pattern_id, word_index)) {
    result.status = ScoreStatus::kNotASolution;
    result.error = normalized_word + " is not a solution for plate " +
                   Corpus::DisplayPattern(normalized_pattern);
    return result;
  }

  const PatternStats& stats = index.StatsFor(pattern_id);
  const double mass = stats.total_mass;
  const double probability =
      static_cast<double>(corpus.entry(word_index).frequency) / mass;
  const double bits = -std::log2(probability);
  const double max_possible = std::log2(mass);

  double normalized = 0.0;
  if (max_possible > 0.0) {
    normalized = std::min(bits / max_possible * 100.0, 100.0);
  }
  normalized = std::max(0.0, normalized);

  result.score = normalized;
  result.metrics = {
      {"information_bits", bits},
      {"probability", probability},
      {"normalized_score", normalized},
      {"percentile_in_plate", PercentileInPattern(bits, stats)},
      {"plate_entropy", stats.entropy},
      {"plate_total_frequency", mass},
      {"plate_solution_count", static_cast<double>(stats.num_solutions)},
      {"plate_avg_bits", stats.avg_info_bits},
      {"plate_min_bits", stats.min_info_bits},
      {"plate_max_bits", stats.max_info_bits},
  };
  result.interpretation = InterpretInformation(normalized);
  return result;
}

std::vector<WordInformation> TopWordsForPattern(const CorpusIndex& index,
                                                std::string_view pattern,
                                                size_t limit) {
  std::vector<WordInformation> out;
  size_t pattern_id = 0;
  if (!index.FindPattern(pattern, &pattern_id)) {
    return out;
  }
  const PatternStats& stats = index.StatsFor(pattern_id);
  if (stats.total_mass <= 0.0) {
    return out;
  }
  const double mass = stats.total_mass;
  for (const Solution& solution : index.SolutionsFor(pattern_id)) {
    if (solution.frequency == 0) {
      continue;
    }
    WordInformation info;
    info.word = index.corpus().entry(solution.word_index).word;
    info.frequency = solution.frequency;
    info.probability = static_cast<double>(solution.frequency) / mass;
    info.information_bits = -std::log2(info.probability);
    out.push_back(std::move(info));
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const WordInformation& a, const WordInformation& b) {
                     return a.information_bits > b.information_bits;
                   });
  if (out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

IndexSummary SummarizeIndex(const CorpusIndex& index) {
  IndexSummary summary;
  summary.total_patterns = index.pattern_count();
  summary.patterns_with_solutions = index.patterns_with_solutions();
  summary.total_solutions = index.total_solutions();

  double entropy_sum = 0.0;
  double bits_sum = 0.0;
  double min_bits = std::numeric_limits<double>::infinity();
  double max_bits = 0.0;
  size_t counted = 0;
  for (size_t id = 0; id < index.pattern_count(); ++id) {
    const PatternStats& stats = index.StatsFor(id);
    if (stats.total_mass <= 0.0) {
      continue;
    }
    entropy_sum += stats.entropy;
    bits_sum += stats.avg_info_bits;
    min_bits = std::min(min_bits, stats.min_info_bits);
    max_bits = std::max(max_bits, stats.max_info_bits);
    ++counted;
  }
  if (counted > 0) {
    summary.avg_pattern_entropy = entropy_sum / static_cast<double>(counted);
    summary.avg_information_bits = bits_sum / static_cast<double>(counted);
    summary.min_information_bits = min_bits;
    summary.max_information_bits = max_bits;
  }
  return summary;
}

}  // namespace platewise
