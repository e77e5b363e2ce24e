#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace platewise {

constexpr size_t kMinPatternLength = 2;
constexpr size_t kMaxPatternLength = 8;
constexpr size_t kMaxFullCoverageLength = 4;
constexpr char kWildcard = '?';
constexpr std::string_view kAlphabet = "abcdefghijklmnopqrstuvwxyz";

constexpr size_t kPercentileCount = 9;
constexpr std::array<double, kPercentileCount> kRarityPercentiles = {
    5.0, 10.0, 25.0, 50.0, 75.0, 90.0, 95.0, 99.0, 99.9};

enum class MatchMode {
  kSubsequence,
  kSubstring,
  kAnagram,
  kAnagramSubset,
  kPositional,
};

bool ParseMatchMode(std::string_view name, MatchMode* out);
const char* MatchModeName(MatchMode mode);

struct WordFrequency {
  std::string word;
  uint64_t frequency = 0;
};

struct FrequencyStats {
  size_t total_words = 0;
  uint64_t max_frequency = 0;
  uint64_t min_frequency = 0;
  uint64_t median_frequency = 0;
  double mean_frequency = 0.0;
  double max_log_frequency = 0.0;
  double min_log_frequency = 0.0;
  double median_log_frequency = 0.0;
  double mean_log_frequency = 0.0;
  double std_log_frequency = 0.0;
  // Indexed like kRarityPercentiles.
  std::array<uint64_t, kPercentileCount> percentile_thresholds{};
};

class Corpus {
 public:
  struct Entry {
    std::string word;
    uint64_t frequency = 0;
    uint32_t letter_mask = 0;
  };

  // Entries that fail normalization are skipped. A repeated word keeps its
  // first position and takes the last frequency seen.
  static std::shared_ptr<const Corpus> Create(
      const std::vector<std::pair<std::string, uint64_t>>& pairs,
      size_t* rejected_out = nullptr);

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const std::vector<Entry>& entries() const { return entries_; }
  const Entry& entry(size_t index) const { return entries_[index]; }
  const FrequencyStats& stats() const { return stats_; }

  bool Find(std::string_view word, size_t* index_out) const;
  uint64_t Frequency(std::string_view word) const;
  size_t FrequencyRank(uint64_t frequency) const;
  const std::vector<uint64_t>& sorted_frequencies() const {
    return sorted_frequencies_;
  }

  static bool IsValidWord(std::string_view word);
  static bool NormalizeWord(std::string_view word, std::string* out);
  static bool NormalizePattern(std::string_view pattern, MatchMode mode,
                               std::string* out);
  static std::string DisplayPattern(std::string_view pattern);
  static uint32_t LetterMask(std::string_view word);

 private:
  Corpus() = default;

  void ComputeStats();

  std::vector<Entry> entries_;
  std::unordered_map<std::string, size_t> index_by_word_;
  std::vector<uint64_t> sorted_frequencies_;
  FrequencyStats stats_;
};

bool LoadCorpusFile(const std::string& path,
                    std::vector<std::pair<std::string, uint64_t>>* out,
                    size_t* skipped_lines,
                    std::string* error);

class Matcher {
 public:
  static bool Subsequence(std::string_view pattern, std::string_view word);
  static bool Substring(std::string_view pattern, std::string_view word);
  static bool Anagram(std::string_view pattern, std::string_view word);
  static bool AnagramSubset(std::string_view pattern, std::string_view word);
  static bool Positional(std::string_view pattern, std::string_view word);

  static bool Matches(MatchMode mode,
                      std::string_view pattern,
                      std::string_view word);
  static bool UsesLetterMask(MatchMode mode);
};

// Indices into corpus.entries(), frequency descending, ties in corpus order.
// `pattern` must already be normalized for `mode`.
void SolveIndices(const Corpus& corpus,
                  std::string_view pattern,
                  MatchMode mode,
                  std::vector<uint32_t>* out);

std::vector<WordFrequency> Solve(const Corpus& corpus,
                                 std::string_view pattern,
                                 MatchMode mode = MatchMode::kSubsequence);

std::vector<std::string> GeneratePatterns(std::string_view alphabet,
                                          size_t length);
std::vector<std::string> SamplePatterns(std::string_view alphabet,
                                        size_t length,
                                        size_t count,
                                        uint32_t seed);

enum class CoverageMode {
  kFull,
  kPartial,
};

bool ParseCoverageMode(std::string_view name, CoverageMode* out);
const char* CoverageModeName(CoverageMode mode);

struct Solution {
  uint32_t word_index = 0;
  uint64_t frequency = 0;
};

struct PatternStats {
  // Sum of solution frequencies; kept in floating point so it cannot wrap.
  double total_mass = 0.0;
  double entropy = 0.0;
  size_t num_solutions = 0;
  double avg_info_bits = 0.0;
  double min_info_bits = 0.0;
  double max_info_bits = 0.0;
};

using PatternSolver = std::function<void(const Corpus&,
                                         std::string_view,
                                         std::vector<uint32_t>*)>;

struct IndexBuildOptions {
  CoverageMode coverage = CoverageMode::kFull;
  size_t pattern_length = 3;
  std::vector<std::string> sample_patterns;
  int threads = 0;
  const std::atomic<bool>* cancel = nullptr;
  std::ostream* log = nullptr;
  // Defaults to subsequence solving.
  PatternSolver solver;
};

class CorpusIndex {
 public:
  const Corpus& corpus() const { return *corpus_; }
  const std::shared_ptr<const Corpus>& corpus_ptr() const { return corpus_; }
  CoverageMode coverage() const { return coverage_; }
  size_t pattern_length() const { return pattern_length_; }

  size_t pattern_count() const { return patterns_.size(); }
  const std::vector<std::string>& patterns() const { return patterns_; }
  bool FindPattern(std::string_view pattern, size_t* id_out) const;

  const std::vector<Solution>& SolutionsFor(size_t pattern_id) const {
    return solutions_[pattern_id];
  }
  const PatternStats& StatsFor(size_t pattern_id) const {
    return stats_[pattern_id];
  }
  // Sorted pattern ids.
  const std::vector<uint32_t>& PatternsFor(size_t word_index) const {
    return patterns_for_[word_index];
  }
  bool IsSolution(size_t pattern_id, size_t word_index) const;

  std::vector<WordFrequency> Solutions(std::string_view pattern) const;
  std::vector<std::string> PatternsForWord(std::string_view word) const;

  size_t total_solutions() const { return total_solutions_; }
  size_t patterns_with_solutions() const { return patterns_with_solutions_; }
  const std::vector<std::string>& failed_patterns() const {
    return failed_patterns_;
  }
  const std::vector<std::string>& rejected_samples() const {
    return rejected_samples_;
  }

 private:
  friend std::shared_ptr<const CorpusIndex> BuildCorpusIndex(
      std::shared_ptr<const Corpus> corpus,
      const IndexBuildOptions& options,
      std::string* error);

  CorpusIndex() = default;

  std::shared_ptr<const Corpus> corpus_;
  CoverageMode coverage_ = CoverageMode::kFull;
  size_t pattern_length_ = 0;
  std::vector<std::string> patterns_;
  std::unordered_map<std::string, size_t> pattern_ids_;
  std::vector<std::vector<Solution>> solutions_;
  std::vector<PatternStats> stats_;
  std::vector<std::vector<uint32_t>> patterns_for_;
  std::vector<std::string> failed_patterns_;
  std::vector<std::string> rejected_samples_;
  size_t total_solutions_ = 0;
  size_t patterns_with_solutions_ = 0;
};

// Returns null and fills `error` on invalid options or cancellation.
std::shared_ptr<const CorpusIndex> BuildCorpusIndex(
    std::shared_ptr<const Corpus> corpus,
    const IndexBuildOptions& options,
    std::string* error);

PatternStats ComputePatternStats(const std::vector<Solution>& solutions);

}  // namespace platewise
