#include "Solver.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <limits>
#include <ostream>
#include <unordered_set>

namespace platewise {
namespace {
void DefaultSolve(const Corpus& corpus,
                  std::string_view pattern,
                  std::vector<uint32_t>* out) {
  SolveIndices(corpus, pattern, MatchMode::kSubsequence, out);
}

bool Cancelled(const IndexBuildOptions& options) {
  return options.cancel != nullptr &&
         options.cancel->load(std::memory_order_relaxed);
}
}  // namespace

bool ParseCoverageMode(std::string_view name, CoverageMode* out) {
  CoverageMode mode;
  if (name == "full") {
    mode = CoverageMode::kFull;
  } else if (name == "partial") {
    mode = CoverageMode::kPartial;
  } else {
    return false;
  }
  if (out) {
    *out = mode;
  }
  return true;
}

const char* CoverageModeName(CoverageMode mode) {
  switch (mode) {
    case CoverageMode::kFull:
      return "full";
    case CoverageMode::kPartial:
      return "partial";
  }
  return "full";
}

bool CorpusIndex::FindPattern(std::string_view pattern, size_t* id_out) const {
  std::string normalized;
  if (!Corpus::NormalizePattern(pattern, MatchMode::kSubsequence,
                                &normalized)) {
    return false;
  }
  auto it = pattern_ids_.find(normalized);
  if (it == pattern_ids_.end()) {
    return false;
  }
  if (id_out) {
    *id_out = it->second;
  }
  return true;
}

bool CorpusIndex::IsSolution(size_t pattern_id, size_t word_index) const {
  if (word_index >= patterns_for_.size()) {
    return false;
  }
  const std::vector<uint32_t>& ids = patterns_for_[word_index];
  return std::binary_search(ids.begin(), ids.end(),
                            static_cast<uint32_t>(pattern_id));
}

std::vector<WordFrequency> CorpusIndex::Solutions(
    std::string_view pattern) const {
  std::vector<WordFrequency> out;
  size_t id = 0;
  if (!FindPattern(pattern, &id)) {
    return out;
  }
  out.reserve(solutions_[id].size());
  for (const Solution& solution : solutions_[id]) {
    out.push_back({corpus_->entry(solution.word_index).word,
                   solution.frequency});
  }
  return out;
}

std::vector<std::string> CorpusIndex::PatternsForWord(
    std::string_view word) const {
  std::vector<std::string> out;
  std::string normalized;
  size_t index = 0;
  if (!Corpus::NormalizeWord(word, &normalized) ||
      !corpus_->Find(normalized, &index)) {
    return out;
  }
  out.reserve(patterns_for_[index].size());
  for (uint32_t id : patterns_for_[index]) {
    out.push_back(patterns_[id]);
  }
  return out;
}

PatternStats ComputePatternStats(const std::vector<Solution>& solutions) {
  PatternStats stats;
  stats.num_solutions = solutions.size();
  for (const Solution& solution : solutions) {
    stats.total_mass += static_cast<double>(solution.frequency);
  }
  if (stats.total_mass <= 0.0) {
    return stats;
  }

  const double inv_mass = 1.0 / stats.total_mass;
  double sum_bits = 0.0;
  double min_bits = std::numeric_limits<double>::infinity();
  double max_bits = 0.0;
  size_t counted = 0;
  for (const Solution& solution : solutions) {
    if (solution.frequency == 0) {
      continue;
    }
    double p = static_cast<double>(solution.frequency) * inv_mass;
    double bits = -std::log2(p);
    stats.entropy += p * bits;
    sum_bits += bits;
    min_bits = std::min(min_bits, bits);
    max_bits = std::max(max_bits, bits);
    ++counted;
  }
  if (counted > 0) {
    stats.avg_info_bits = sum_bits / static_cast<double>(counted);
    stats.min_info_bits = min_bits;
    stats.max_info_bits = max_bits;
  }
  return stats;
}

std::shared_ptr<const CorpusIndex> BuildCorpusIndex(
    std::shared_ptr<const Corpus> corpus,
    const IndexBuildOptions& options,
    std::string* error) {
  auto fail = [error](const std::string& message) {
    if (error) {
      *error = message;
    }
    return std::shared_ptr<const CorpusIndex>();
  };
  if (!corpus) {
    return fail("no corpus to index");
  }

  std::shared_ptr<CorpusIndex> index(new CorpusIndex());
  index->corpus_ = corpus;
  index->coverage_ = options.coverage;

  std::vector<std::string> patterns;
  if (options.coverage == CoverageMode::kFull) {
    if (options.pattern_length < kMinPatternLength ||
        options.pattern_length > kMaxFullCoverageLength) {
      return fail("full coverage needs a plate length between " +
                  std::to_string(kMinPatternLength) + " and " +
                  std::to_string(kMaxFullCoverageLength));
    }
    index->pattern_length_ = options.pattern_length;
    patterns = GeneratePatterns(kAlphabet, options.pattern_length);
  } else {
    std::unordered_set<std::string> seen;
    std::string normalized;
    for (const std::string& sample : options.sample_patterns) {
      if (!Corpus::NormalizePattern(sample, MatchMode::kSubsequence,
                                    &normalized)) {
        if (options.log) {
          *options.log << "Warning: rejected sample plate '" << sample
                       << "'\n";
        }
        index->rejected_samples_.push_back(sample);
        continue;
      }
      if (seen.insert(normalized).second) {
        patterns.push_back(normalized);
      }
    }
    std::sort(patterns.begin(), patterns.end());
    index->pattern_length_ = options.pattern_length;
    for (const std::string& pattern : patterns) {
      if (pattern.size() != options.pattern_length) {
        index->pattern_length_ = 0;
        break;
      }
    }
  }

  const PatternSolver solver =
      options.solver ? options.solver : PatternSolver(DefaultSolve);
  const size_t count = patterns.size();
  std::vector<std::vector<uint32_t>> slots(count);
  std::vector<std::string> failures(count);
  std::vector<char> failed(count, 0);

  if (options.log) {
    *options.log << "Building " << CoverageModeName(options.coverage)
                 << " plate index: " << count << " plates x "
                 << corpus->size() << " words\n";
  }
  auto start = std::chrono::high_resolution_clock::now();

#ifdef _OPENMP
  int threads = options.threads > 0 ? options.threads : omp_get_max_threads();
#pragma omp parallel for schedule(dynamic, 64) num_threads(threads)
#endif
  for (size_t i = 0; i < count; ++i) {
    if (Cancelled(options)) {
      continue;
    }
    try {
      solver(*corpus, patterns[i], &slots[i]);
    } catch (const std::exception& e) {
      slots[i].clear();
      failed[i] = 1;
      failures[i] = e.what();
    }
  }

  if (Cancelled(options)) {
    if (options.log) {
      *options.log << "Plate index build cancelled.\n";
    }
    return fail("index build cancelled");
  }

  index->patterns_ = std::move(patterns);
  index->solutions_.resize(count);
  index->stats_.resize(count);
  index->patterns_for_.assign(corpus->size(), {});
  index->pattern_ids_.reserve(count);

  for (size_t id = 0; id < count; ++id) {
    const std::string& pattern = index->patterns_[id];
    index->pattern_ids_.emplace(pattern, id);
    if (failed[id]) {
      index->failed_patterns_.push_back(pattern);
      if (options.log) {
        *options.log << "Warning: could not solve plate "
                     << Corpus::DisplayPattern(pattern) << ": "
                     << failures[id] << "\n";
      }
    }

    std::vector<Solution>& solutions = index->solutions_[id];
    solutions.reserve(slots[id].size());
    for (uint32_t word_index : slots[id]) {
      if (word_index >= corpus->size()) {
        continue;
      }
      solutions.push_back({word_index, corpus->entry(word_index).frequency});
      index->patterns_for_[word_index].push_back(static_cast<uint32_t>(id));
    }
    std::vector<uint32_t>().swap(slots[id]);

    index->stats_[id] = ComputePatternStats(solutions);
    index->total_solutions_ += solutions.size();
    if (!solutions.empty()) {
      ++index->patterns_with_solutions_;
    }
  }

  if (options.log) {
    auto end = std::chrono::high_resolution_clock::now();
    double seconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(end - start)
            .count();
    *options.log << "Plate index ready: " << index->patterns_with_solutions_
                 << "/" << count << " plates with solutions, "
                 << index->total_solutions_ << " solutions, "
                 << index->failed_patterns_.size() << " failed, "
                 << std::fixed << std::setprecision(2) << seconds << "s\n";
  }
  return index;
}

}  // namespace platewise
