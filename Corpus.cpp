#include "Solver.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace platewise {
namespace {
std::string TrimWhitespace(const std::string& input) {
  size_t start = 0;
  while (start < input.size() &&
         std::isspace(static_cast<unsigned char>(input[start]))) {
    ++start;
  }
  size_t end = input.size();
  while (end > start &&
         std::isspace(static_cast<unsigned char>(input[end - 1]))) {
    --end;
  }
  return input.substr(start, end - start);
}

bool ParseFrequency(const std::string& text, uint64_t* out) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  try {
    *out = static_cast<uint64_t>(std::stoull(text));
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}
}  // namespace

std::shared_ptr<const Corpus> Corpus::Create(
    const std::vector<std::pair<std::string, uint64_t>>& pairs,
    size_t* rejected_out) {
  std::shared_ptr<Corpus> corpus(new Corpus());
  size_t rejected = 0;
  corpus->entries_.reserve(pairs.size());
  corpus->index_by_word_.reserve(pairs.size());

  std::string normalized;
  for (const auto& pair : pairs) {
    if (!NormalizeWord(pair.first, &normalized)) {
      ++rejected;
      continue;
    }
    auto it = corpus->index_by_word_.find(normalized);
    if (it != corpus->index_by_word_.end()) {
      corpus->entries_[it->second].frequency = pair.second;
      continue;
    }
    Entry entry;
    entry.word = normalized;
    entry.frequency = pair.second;
    entry.letter_mask = LetterMask(normalized);
    corpus->index_by_word_.emplace(normalized, corpus->entries_.size());
    corpus->entries_.push_back(std::move(entry));
  }

  corpus->ComputeStats();
  if (rejected_out) {
    *rejected_out = rejected;
  }
  return corpus;
}

void Corpus::ComputeStats() {
  stats_ = FrequencyStats();
  sorted_frequencies_.clear();
  const size_t n = entries_.size();
  if (n == 0) {
    return;
  }

  sorted_frequencies_.reserve(n);
  Eigen::ArrayXd frequencies(static_cast<Eigen::Index>(n));
  for (size_t i = 0; i < n; ++i) {
    sorted_frequencies_.push_back(entries_[i].frequency);
    frequencies[static_cast<Eigen::Index>(i)] =
        static_cast<double>(entries_[i].frequency);
  }
  std::sort(sorted_frequencies_.begin(), sorted_frequencies_.end(),
            std::greater<uint64_t>());

  Eigen::ArrayXd log_frequencies = (frequencies + 1.0).log();
  const double mean_log = log_frequencies.mean();

  stats_.total_words = n;
  stats_.max_frequency = sorted_frequencies_.front();
  stats_.min_frequency = sorted_frequencies_.back();
  stats_.median_frequency = sorted_frequencies_[n / 2];
  stats_.mean_frequency = frequencies.mean();
  stats_.max_log_frequency = log_frequencies.maxCoeff();
  stats_.min_log_frequency = log_frequencies.minCoeff();
  stats_.median_log_frequency =
      std::log(static_cast<double>(sorted_frequencies_[n / 2]) + 1.0);
  stats_.mean_log_frequency = mean_log;
  stats_.std_log_frequency =
      std::sqrt((log_frequencies - mean_log).square().mean());

  for (size_t k = 0; k < kPercentileCount; ++k) {
    const double p = kRarityPercentiles[k];
    size_t index = static_cast<size_t>(
        std::floor((100.0 - p) * static_cast<double>(n) / 100.0));
    if (index > n - 1) {
      index = n - 1;
    }
    stats_.percentile_thresholds[k] = sorted_frequencies_[index];
  }
}

bool Corpus::Find(std::string_view word, size_t* index_out) const {
  auto it = index_by_word_.find(std::string(word));
  if (it == index_by_word_.end()) {
    return false;
  }
  if (index_out) {
    *index_out = it->second;
  }
  return true;
}

uint64_t Corpus::Frequency(std::string_view word) const {
  std::string normalized;
  if (!NormalizeWord(word, &normalized)) {
    return 0;
  }
  size_t index = 0;
  if (!Find(normalized, &index)) {
    return 0;
  }
  return entries_[index].frequency;
}

size_t Corpus::FrequencyRank(uint64_t frequency) const {
  auto it = std::lower_bound(sorted_frequencies_.begin(),
                             sorted_frequencies_.end(), frequency,
                             std::greater<uint64_t>());
  return static_cast<size_t>(it - sorted_frequencies_.begin()) + 1;
}

bool Corpus::IsValidWord(std::string_view word) {
  if (word.empty()) {
    return false;
  }
  for (char c : word) {
    if (c < 'a' || c > 'z') {
      return false;
    }
  }
  return true;
}

bool Corpus::NormalizeWord(std::string_view word, std::string* out) {
  if (word.empty() || !out) {
    return false;
  }
  std::string normalized;
  normalized.reserve(word.size());
  for (char c : word) {
    if (c >= 'A' && c <= 'Z') {
      normalized.push_back(static_cast<char>(c - 'A' + 'a'));
    } else if (c >= 'a' && c <= 'z') {
      normalized.push_back(c);
    } else {
      return false;
    }
  }
  *out = std::move(normalized);
  return true;
}

bool Corpus::NormalizePattern(std::string_view pattern,
                              MatchMode mode,
                              std::string* out) {
  if (!out || pattern.size() < kMinPatternLength ||
      pattern.size() > kMaxPatternLength) {
    return false;
  }
  std::string normalized;
  normalized.reserve(pattern.size());
  for (char c : pattern) {
    if (c >= 'A' && c <= 'Z') {
      normalized.push_back(static_cast<char>(c - 'A' + 'a'));
    } else if (c >= 'a' && c <= 'z') {
      normalized.push_back(c);
    } else if (c == kWildcard && mode == MatchMode::kPositional) {
      normalized.push_back(c);
    } else {
      return false;
    }
  }
  *out = std::move(normalized);
  return true;
}

std::string Corpus::DisplayPattern(std::string_view pattern) {
  std::string out(pattern);
  for (char& c : out) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return out;
}

uint32_t Corpus::LetterMask(std::string_view word) {
  uint32_t mask = 0;
  for (char c : word) {
    if (c >= 'a' && c <= 'z') {
      mask |= 1U << (c - 'a');
    }
  }
  return mask;
}

bool LoadCorpusFile(const std::string& path,
                    std::vector<std::pair<std::string, uint64_t>>* out,
                    size_t* skipped_lines,
                    std::string* error) {
  if (!out) {
    return false;
  }
  out->clear();
  std::ifstream infile(path);
  if (!infile) {
    if (error) {
      *error = "cannot open corpus file: " + path;
    }
    return false;
  }

  size_t skipped = 0;
  std::string line;
  while (std::getline(infile, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    for (char& c : line) {
      if (c == ',' || c == '\t') {
        c = ' ';
      }
    }
    std::istringstream iss(line);
    std::string word;
    std::string count;
    std::string extra;
    uint64_t frequency = 0;
    if (!(iss >> word >> count) || (iss >> extra) ||
        !ParseFrequency(count, &frequency)) {
      ++skipped;
      continue;
    }
    out->emplace_back(std::move(word), frequency);
  }

  if (skipped_lines) {
    *skipped_lines = skipped;
  }
  if (out->empty()) {
    if (error) {
      *error = "no word/frequency entries in corpus file: " + path;
    }
    return false;
  }
  return true;
}

}  // namespace platewise
