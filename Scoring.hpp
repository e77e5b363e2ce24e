#pragma once

#include "Solver.hpp"

#include <Eigen/Dense>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace platewise {

enum class ScoreStatus {
  kOk,
  kInvalidInput,
  kNotFound,
  kUncoveredPattern,
  kNotASolution,
  kAllFailed,
};

const char* ScoreStatusName(ScoreStatus status);

struct Metric {
  std::string name;
  double value = 0.0;
};

struct ScoreResult {
  std::string dimension;
  ScoreStatus status = ScoreStatus::kOk;
  std::string error;
  double score = 0.0;
  std::vector<Metric> metrics;
  std::string interpretation;

  bool ok() const { return status == ScoreStatus::kOk; }
  double MetricValue(std::string_view name, double fallback = 0.0) const;
};

constexpr const char* kFrequencyDimension = "frequency";
constexpr const char* kInformationDimension = "information";
constexpr const char* kOrthographicDimension = "orthographic";

ScoreResult ScoreFrequency(const Corpus& corpus, std::string_view word);

struct RareWord {
  std::string word;
  uint64_t frequency = 0;
  double combined_score = 0.0;
  double percentile_rarity = 0.0;
};

std::vector<RareWord> RarestWords(const Corpus& corpus, size_t limit);

ScoreResult ScoreInformation(const CorpusIndex& index,
                             std::string_view word,
                             std::string_view pattern);

struct WordInformation {
  std::string word;
  uint64_t frequency = 0;
  double information_bits = 0.0;
  double probability = 0.0;
};

std::vector<WordInformation> TopWordsForPattern(const CorpusIndex& index,
                                                std::string_view pattern,
                                                size_t limit);

struct IndexSummary {
  size_t total_patterns = 0;
  size_t patterns_with_solutions = 0;
  size_t total_solutions = 0;
  double avg_pattern_entropy = 0.0;
  double avg_information_bits = 0.0;
  double min_information_bits = 0.0;
  double max_information_bits = 0.0;
};

IndexSummary SummarizeIndex(const CorpusIndex& index);

class NGramModel {
 public:
  static constexpr char kStartMarker = '^';
  static constexpr char kEndMarker = '$';
  static constexpr double kUnseenProbability = 1e-10;
  static constexpr size_t kTopNGrams = 20;

  struct Stats {
    size_t corpus_words = 0;
    size_t unique_bigrams = 0;
    size_t unique_trigrams = 0;
    // Frequency-weighted totals.
    double total_bigrams = 0.0;
    double total_trigrams = 0.0;
    double bigram_entropy = 0.0;
    double trigram_entropy = 0.0;
    std::vector<std::pair<std::string, double>> top_bigrams;
    std::vector<std::pair<std::string, double>> top_trigrams;
  };

  static std::shared_ptr<const NGramModel> Build(const Corpus& corpus);

  double BigramProbability(std::string_view bigram) const;
  double TrigramProbability(std::string_view trigram) const;
  double Probability(std::string_view ngram) const;
  const Stats& stats() const { return stats_; }

  static std::string Pad(std::string_view word);

 private:
  NGramModel() = default;

  std::unordered_map<std::string, double> bigram_probs_;
  std::unordered_map<std::string, double> trigram_probs_;
  Stats stats_;
};

struct NGramSurprisal {
  std::string ngram;
  double bits = 0.0;
};

ScoreResult ScoreOrthographic(const NGramModel& model, std::string_view word);
std::vector<NGramSurprisal> OrthographicDetails(const NGramModel& model,
                                                std::string_view word,
                                                size_t order);

struct EnsembleWeights {
  double frequency = 1.0 / 3.0;
  double information = 1.0 / 3.0;
  double orthographic = 1.0 / 3.0;
};

struct EnsembleOptions {
  // Off: missing components count as zero against the full weight sum.
  bool renormalize_missing = false;
};

struct EnsembleResult {
  std::string word;
  std::string pattern;
  ScoreStatus status = ScoreStatus::kOk;
  std::string error;
  double score = 0.0;
  double confidence = 0.0;
  int working_components = 0;
  EnsembleWeights weights;
  ScoreResult frequency;
  ScoreResult information;
  ScoreResult orthographic;

  bool ok() const { return status == ScoreStatus::kOk; }
};

EnsembleResult ScoreEnsemble(const Corpus& corpus,
                             const CorpusIndex& index,
                             const NGramModel& model,
                             std::string_view word,
                             std::string_view pattern,
                             const EnsembleWeights& weights = EnsembleWeights(),
                             const EnsembleOptions& options = EnsembleOptions());

class FeatureExtractor {
 public:
  explicit FeatureExtractor(std::shared_ptr<const CorpusIndex> index);

  static const std::vector<std::string>& FeatureNames();

  // False when the word or plate fails normalization or the plate is outside
  // a partial index.
  bool Extract(std::string_view word,
               std::string_view pattern,
               Eigen::VectorXd* out,
               ScoreStatus* status = nullptr) const;

  static std::vector<int> SubsequencePositions(std::string_view pattern,
                                               std::string_view word);

 private:
  std::shared_ptr<const CorpusIndex> index_;
};

class ScoringEngine {
 public:
  struct Snapshot {
    std::shared_ptr<const Corpus> corpus;
    std::shared_ptr<const CorpusIndex> index;
    std::shared_ptr<const NGramModel> ngrams;
  };

  ScoringEngine() = default;
  ScoringEngine(const ScoringEngine&) = delete;
  ScoringEngine& operator=(const ScoringEngine&) = delete;

  // Builds a complete snapshot, then publishes it. On failure the current
  // snapshot stays in place.
  bool Rebuild(std::shared_ptr<const Corpus> corpus,
               const IndexBuildOptions& options,
               std::string* error);
  void Publish(std::shared_ptr<const Snapshot> snapshot);

  std::shared_ptr<const Snapshot> snapshot() const;
  bool ready() const { return snapshot() != nullptr; }

  std::vector<WordFrequency> Solve(std::string_view pattern,
                                   MatchMode mode) const;
  ScoreResult ScoreFrequency(std::string_view word) const;
  ScoreResult ScoreInformation(std::string_view word,
                               std::string_view pattern) const;
  ScoreResult ScoreOrthographic(std::string_view word) const;
  EnsembleResult Score(std::string_view word,
                       std::string_view pattern,
                       const EnsembleWeights& weights = EnsembleWeights(),
                       const EnsembleOptions& options = EnsembleOptions()) const;

 private:
  std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace platewise
