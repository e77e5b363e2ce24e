#include "Solver.hpp"

#include <algorithm>
#include <array>
#include <random>

#if defined(PLATEWISE_USE_HWY)
#include "hwy/highway.h"
#endif

namespace platewise {
namespace {
constexpr int kLetterCount = 26;

bool CountLetters(std::string_view text, std::array<int, kLetterCount>* counts) {
  counts->fill(0);
  for (char c : text) {
    if (c < 'a' || c > 'z') {
      return false;
    }
    (*counts)[c - 'a']++;
  }
  return true;
}

std::string NormalizeAlphabet(std::string_view alphabet) {
  std::string letters;
  for (char c : alphabet) {
    if (c >= 'A' && c <= 'Z') {
      letters.push_back(static_cast<char>(c - 'A' + 'a'));
    } else if (c >= 'a' && c <= 'z') {
      letters.push_back(c);
    }
  }
  std::sort(letters.begin(), letters.end());
  letters.erase(std::unique(letters.begin(), letters.end()), letters.end());
  return letters;
}
}  // namespace

bool ParseMatchMode(std::string_view name, MatchMode* out) {
  MatchMode mode;
  if (name == "subsequence") {
    mode = MatchMode::kSubsequence;
  } else if (name == "substring") {
    mode = MatchMode::kSubstring;
  } else if (name == "anagram") {
    mode = MatchMode::kAnagram;
  } else if (name == "anagram_subset") {
    mode = MatchMode::kAnagramSubset;
  } else if (name == "pattern") {
    mode = MatchMode::kPositional;
  } else {
    return false;
  }
  if (out) {
    *out = mode;
  }
  return true;
}

const char* MatchModeName(MatchMode mode) {
  switch (mode) {
    case MatchMode::kSubsequence:
      return "subsequence";
    case MatchMode::kSubstring:
      return "substring";
    case MatchMode::kAnagram:
      return "anagram";
    case MatchMode::kAnagramSubset:
      return "anagram_subset";
    case MatchMode::kPositional:
      return "pattern";
  }
  return "subsequence";
}

bool Matcher::Subsequence(std::string_view pattern, std::string_view word) {
  size_t cursor = 0;
  for (char c : word) {
    if (cursor == pattern.size()) {
      break;
    }
    if (c == pattern[cursor]) {
      ++cursor;
    }
  }
  return cursor == pattern.size();
}

bool Matcher::Substring(std::string_view pattern, std::string_view word) {
  return word.find(pattern) != std::string_view::npos;
}

bool Matcher::Anagram(std::string_view pattern, std::string_view word) {
  if (pattern.size() != word.size()) {
    return false;
  }
  std::array<int, kLetterCount> pattern_counts{};
  std::array<int, kLetterCount> word_counts{};
  if (!CountLetters(pattern, &pattern_counts) ||
      !CountLetters(word, &word_counts)) {
    return false;
  }
  return pattern_counts == word_counts;
}

bool Matcher::AnagramSubset(std::string_view pattern, std::string_view word) {
  if (pattern.size() > word.size()) {
    return false;
  }
  std::array<int, kLetterCount> pattern_counts{};
  std::array<int, kLetterCount> word_counts{};
  if (!CountLetters(pattern, &pattern_counts) ||
      !CountLetters(word, &word_counts)) {
    return false;
  }
  for (int i = 0; i < kLetterCount; ++i) {
    if (word_counts[i] < pattern_counts[i]) {
      return false;
    }
  }
  return true;
}

bool Matcher::Positional(std::string_view pattern, std::string_view word) {
  if (pattern.size() != word.size()) {
    return false;
  }
  for (size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] != kWildcard && pattern[i] != word[i]) {
      return false;
    }
  }
  return true;
}

bool Matcher::Matches(MatchMode mode,
                      std::string_view pattern,
                      std::string_view word) {
  switch (mode) {
    case MatchMode::kSubsequence:
      return Subsequence(pattern, word);
    case MatchMode::kSubstring:
      return Substring(pattern, word);
    case MatchMode::kAnagram:
      return Anagram(pattern, word);
    case MatchMode::kAnagramSubset:
      return AnagramSubset(pattern, word);
    case MatchMode::kPositional:
      return Positional(pattern, word);
  }
  return false;
}

bool Matcher::UsesLetterMask(MatchMode mode) {
  return mode != MatchMode::kPositional;
}

void SolveIndices(const Corpus& corpus,
                  std::string_view pattern,
                  MatchMode mode,
                  std::vector<uint32_t>* out) {
  if (!out) {
    return;
  }
  out->clear();
  if (pattern.empty()) {
    return;
  }

  const std::vector<Corpus::Entry>& entries = corpus.entries();
  const bool use_mask = Matcher::UsesLetterMask(mode);
  const uint32_t pattern_mask = use_mask ? Corpus::LetterMask(pattern) : 0;
  bool scanned = false;

#if defined(PLATEWISE_USE_HWY)
  if (use_mask && pattern_mask != 0) {
    namespace hn = hwy::HWY_NAMESPACE;

    const hn::ScalableTag<uint32_t> d;
    const size_t lanes = hn::Lanes(d);
    if (lanes > 1) {
      std::vector<uint32_t> masks(lanes);
      std::vector<uint32_t> pass(lanes);
      const auto wanted = hn::Set(d, pattern_mask);

      for (size_t offset = 0; offset < entries.size(); offset += lanes) {
        size_t batch = 0;
        for (; batch < lanes && (offset + batch) < entries.size(); ++batch) {
          masks[batch] = entries[offset + batch].letter_mask;
        }
        for (; batch < lanes; ++batch) {
          masks[batch] = 0;
        }

        auto v = hn::LoadU(d, masks.data());
        auto cmp = hn::Eq(hn::And(v, wanted), wanted);
        auto pass_vec = hn::IfThenElse(cmp, hn::Set(d, 1u), hn::Zero(d));
        hn::StoreU(pass_vec, d, pass.data());

        for (size_t lane = 0; lane < lanes; ++lane) {
          size_t index = offset + lane;
          if (index >= entries.size() || pass[lane] == 0) {
            continue;
          }
          if (Matcher::Matches(mode, pattern, entries[index].word)) {
            out->push_back(static_cast<uint32_t>(index));
          }
        }
      }
      scanned = true;
    }
  }
#endif

  if (!scanned) {
    for (size_t index = 0; index < entries.size(); ++index) {
      const Corpus::Entry& entry = entries[index];
      if (use_mask && (entry.letter_mask & pattern_mask) != pattern_mask) {
        continue;
      }
      if (Matcher::Matches(mode, pattern, entry.word)) {
        out->push_back(static_cast<uint32_t>(index));
      }
    }
  }

  std::stable_sort(out->begin(), out->end(), [&](uint32_t a, uint32_t b) {
    return entries[a].frequency > entries[b].frequency;
  });
}

std::vector<WordFrequency> Solve(const Corpus& corpus,
                                 std::string_view pattern,
                                 MatchMode mode) {
  std::vector<WordFrequency> solutions;
  std::string normalized;
  if (!Corpus::NormalizePattern(pattern, mode, &normalized)) {
    return solutions;
  }
  std::vector<uint32_t> indices;
  SolveIndices(corpus, normalized, mode, &indices);
  solutions.reserve(indices.size());
  for (uint32_t index : indices) {
    const Corpus::Entry& entry = corpus.entry(index);
    solutions.push_back({entry.word, entry.frequency});
  }
  return solutions;
}

std::vector<std::string> GeneratePatterns(std::string_view alphabet,
                                          size_t length) {
  std::vector<std::string> patterns;
  const std::string letters = NormalizeAlphabet(alphabet);
  if (letters.empty() || length == 0) {
    return patterns;
  }

  size_t total = 1;
  for (size_t i = 0; i < length; ++i) {
    total *= letters.size();
  }
  patterns.reserve(total);

  std::vector<size_t> digits(length, 0);
  std::string current(length, letters[0]);
  for (size_t n = 0; n < total; ++n) {
    patterns.push_back(current);
    for (size_t pos = length; pos-- > 0;) {
      if (++digits[pos] < letters.size()) {
        current[pos] = letters[digits[pos]];
        break;
      }
      digits[pos] = 0;
      current[pos] = letters[0];
    }
  }
  return patterns;
}

std::vector<std::string> SamplePatterns(std::string_view alphabet,
                                        size_t length,
                                        size_t count,
                                        uint32_t seed) {
  std::vector<std::string> patterns;
  const std::string letters = NormalizeAlphabet(alphabet);
  if (letters.empty() || length == 0) {
    return patterns;
  }
  std::mt19937 rng(seed);
  std::uniform_int_distribution<size_t> dist(0, letters.size() - 1);
  patterns.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    std::string pattern(length, letters[0]);
    for (char& c : pattern) {
      c = letters[dist(rng)];
    }
    patterns.push_back(std::move(pattern));
  }
  return patterns;
}

}  // namespace platewise
