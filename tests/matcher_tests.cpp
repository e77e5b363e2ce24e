#include "Solver.hpp"
#include "TestHarness.hpp"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using platewise_test::ExpectFalse;
using platewise_test::ExpectNear;
using platewise_test::ExpectTrue;
using platewise_test::MakeCorpus;

namespace {
bool SameWords(const std::vector<platewise::WordFrequency>& actual,
               const std::vector<std::string>& expected) {
  if (actual.size() != expected.size()) {
    return false;
  }
  for (size_t i = 0; i < actual.size(); ++i) {
    if (actual[i].word != expected[i]) {
      return false;
    }
  }
  return true;
}

bool NonIncreasing(const std::vector<platewise::WordFrequency>& solutions) {
  for (size_t i = 1; i < solutions.size(); ++i) {
    if (solutions[i].frequency > solutions[i - 1].frequency) {
      return false;
    }
  }
  return true;
}
}  // namespace

int main() {
  using platewise::Matcher;
  using platewise::MatchMode;

  {
    ExpectTrue(Matcher::Subsequence("act", "tact"),
               "subsequence skips leading letters");
    ExpectTrue(Matcher::Subsequence("ct", "cat"), "subsequence allows gaps");
    ExpectFalse(Matcher::Subsequence("act", "cat"),
                "subsequence keeps pattern order");
    ExpectFalse(Matcher::Subsequence("aab", "ab"),
                "subsequence needs repeated letters twice");
    ExpectTrue(Matcher::Substring("ac", "tact"), "substring finds runs");
    ExpectFalse(Matcher::Substring("at", "act"),
                "substring rejects non-contiguous letters");
    ExpectTrue(Matcher::Anagram("tac", "cat"), "anagram equal multisets");
    ExpectFalse(Matcher::Anagram("ta", "tat"), "anagram needs equal length");
    ExpectTrue(Matcher::AnagramSubset("ta", "tact"),
               "anagram subset ignores order");
    ExpectFalse(Matcher::AnagramSubset("tta", "cat"),
                "anagram subset counts repeats");
    ExpectTrue(Matcher::Positional("c?t", "cat"), "wildcard matches any letter");
    ExpectFalse(Matcher::Positional("c?t", "coat"),
                "positional needs equal length");
    ExpectFalse(Matcher::Positional("c?d", "cat"),
                "positional fixed letters must agree");
  }

  {
    MatchMode mode;
    ExpectTrue(platewise::ParseMatchMode("anagram_subset", &mode) &&
                   mode == MatchMode::kAnagramSubset,
               "mode names parse");
    ExpectTrue(platewise::ParseMatchMode("pattern", &mode) &&
                   mode == MatchMode::kPositional,
               "pattern names positional mode");
    ExpectFalse(platewise::ParseMatchMode("fuzzy", &mode),
                "unknown mode names are rejected");
    ExpectTrue(std::string(platewise::MatchModeName(MatchMode::kSubstring)) ==
                   "substring",
               "mode names format");
  }

  auto corpus = MakeCorpus({{"act", 50}, {"tact", 10}, {"cat", 30}});

  {
    auto solutions = platewise::Solve(*corpus, "act");
    ExpectTrue(solutions.size() == 2, "act has two subsequence solutions");
    ExpectTrue(SameWords(solutions, {"act", "tact"}),
               "solutions are ordered by frequency");
    ExpectTrue(solutions.size() == 2 && solutions[0].frequency == 50 &&
                   solutions[1].frequency == 10,
               "solutions carry corpus frequencies");
    ExpectTrue(SameWords(platewise::Solve(*corpus, "ACT"), {"act", "tact"}),
               "patterns are case-insensitive");
  }

  {
    ExpectTrue(SameWords(platewise::Solve(*corpus, "ac", MatchMode::kSubstring),
                         {"act", "tact"}),
               "substring solve");
    ExpectTrue(SameWords(platewise::Solve(*corpus, "tac", MatchMode::kAnagram),
                         {"act", "cat"}),
               "anagram solve");
    ExpectTrue(
        SameWords(platewise::Solve(*corpus, "ta", MatchMode::kAnagramSubset),
                  {"act", "cat", "tact"}),
        "anagram subset solve");
    ExpectTrue(
        SameWords(platewise::Solve(*corpus, "?a?", MatchMode::kPositional),
                  {"cat"}),
        "positional solve");
  }

  {
    ExpectTrue(platewise::Solve(*corpus, "").empty(), "empty pattern");
    ExpectTrue(platewise::Solve(*corpus, "a").empty(), "pattern too short");
    ExpectTrue(platewise::Solve(*corpus, "abcdefghi").empty(),
               "pattern too long");
    ExpectTrue(platewise::Solve(*corpus, "a1").empty(),
               "pattern with digits");
    ExpectTrue(platewise::Solve(*corpus, "?a").empty(),
               "wildcard outside positional mode");
    ExpectTrue(platewise::Solve(*corpus, "zq").empty(), "no matches");
  }

  {
    auto ties = MakeCorpus({{"ab", 5}, {"ba", 5}, {"abb", 5}, {"cab", 9}});
    ExpectTrue(SameWords(platewise::Solve(*ties, "ab"), {"cab", "ab", "abb"}),
               "equal frequencies keep corpus order");
  }

  {
    auto words = MakeCorpus({{"able", 40},   {"bale", 12}, {"table", 90},
                             {"stable", 7},  {"cable", 33}, {"blade", 18},
                             {"label", 25},  {"ball", 60},  {"abbey", 3},
                             {"tablet", 15}, {"bel", 2},    {"lab", 44}});
    const std::vector<std::string> patterns = {"ab", "bl", "ble", "la",
                                               "ta", "el", "abl", "be"};
    const std::vector<std::string> positional = {"?able", "?a??e", "ba??",
                                                 "???",   "l?b??", "lab",
                                                 "??b???", "?????"};
    const MatchMode modes[] = {MatchMode::kSubsequence, MatchMode::kSubstring,
                               MatchMode::kAnagram, MatchMode::kAnagramSubset,
                               MatchMode::kPositional};
    bool complete = true;
    bool ordered = true;
    for (MatchMode mode : modes) {
      const std::vector<std::string>& mode_patterns =
          mode == MatchMode::kPositional ? positional : patterns;
      for (const std::string& pattern : mode_patterns) {
        auto solutions = platewise::Solve(*words, pattern, mode);
        ordered = ordered && NonIncreasing(solutions);
        for (const auto& entry : words->entries()) {
          bool listed = false;
          for (const auto& solution : solutions) {
            listed = listed || solution.word == entry.word;
          }
          if (listed != Matcher::Matches(mode, pattern, entry.word)) {
            complete = false;
          }
        }
      }
    }
    ExpectTrue(complete, "solve lists exactly the matching words");
    ExpectTrue(ordered, "solve output is frequency non-increasing");
    ExpectTrue(SameWords(platewise::Solve(*words, "?ABLE",
                                          MatchMode::kPositional),
                         {"table", "cable"}),
               "positional wildcards match one letter each");
    ExpectTrue(SameWords(platewise::Solve(*words, "???",
                                          MatchMode::kPositional),
                         {"lab", "bel"}),
               "all-wildcard plate matches by length");
  }

  {
    size_t rejected = 0;
    auto dup = platewise::Corpus::Create(
        {{"Act", 5}, {"c4t", 3}, {"tact", 1}, {"act", 7}, {"", 2}}, &rejected);
    ExpectTrue(dup->size() == 2, "duplicates collapse");
    ExpectTrue(rejected == 2, "invalid words are rejected");
    ExpectTrue(dup->Frequency("ACT") == 7, "last frequency wins");
    ExpectTrue(dup->entry(0).word == "act", "first position is kept");
    ExpectTrue(dup->Frequency("dog") == 0, "absent words have no frequency");
  }

  {
    auto stats_corpus = MakeCorpus({{"common", 100}, {"middle", 50}, {"rare", 10}});
    const platewise::FrequencyStats& stats = stats_corpus->stats();
    ExpectTrue(stats.total_words == 3, "stats count words");
    ExpectTrue(stats.max_frequency == 100 && stats.min_frequency == 10,
               "stats frequency range");
    ExpectTrue(stats.median_frequency == 50, "stats median");
    ExpectNear(stats.max_log_frequency, std::log(101.0), 1e-12,
               "max log frequency");
    ExpectTrue(stats.percentile_thresholds[0] == 10,
               "5th percentile threshold");
    ExpectTrue(stats.percentile_thresholds[3] == 50,
               "50th percentile threshold");
    ExpectTrue(stats.percentile_thresholds[8] == 100,
               "99.9th percentile threshold");
    ExpectTrue(stats_corpus->FrequencyRank(100) == 1, "top rank");
    ExpectTrue(stats_corpus->FrequencyRank(10) == 3, "bottom rank");
  }

  {
    auto patterns = platewise::GeneratePatterns("BaA", 2);
    ExpectTrue(patterns.size() == 4, "alphabet is deduplicated");
    ExpectTrue(patterns.size() == 4 && patterns[0] == "aa" &&
                   patterns[1] == "ab" && patterns[2] == "ba" &&
                   patterns[3] == "bb",
               "patterns are enumerated in order");
    ExpectTrue(platewise::GeneratePatterns(platewise::kAlphabet, 3).size() ==
                   17576,
               "full three-letter space");
    auto first = platewise::SamplePatterns(platewise::kAlphabet, 3, 50, 7);
    auto second = platewise::SamplePatterns(platewise::kAlphabet, 3, 50, 7);
    ExpectTrue(first == second, "sampling is seeded");
    bool lengths = first.size() == 50;
    for (const std::string& p : first) {
      lengths = lengths && p.size() == 3;
    }
    ExpectTrue(lengths, "samples have the requested length");
  }

  {
    const std::string path = "platewise_matcher_corpus.txt";
    {
      std::ofstream out(path);
      out << "# word frequency\n"
          << "act 50\n"
          << "tact,10\n"
          << "cat\t30\n"
          << "bad line here\n"
          << "nofreq\n"
          << "\n"
          << "neg -3\n";
    }
    std::vector<std::pair<std::string, uint64_t>> pairs;
    size_t skipped = 0;
    std::string error;
    ExpectTrue(platewise::LoadCorpusFile(path, &pairs, &skipped, &error),
               "corpus file loads");
    ExpectTrue(pairs.size() == 3, "three entries loaded");
    ExpectTrue(skipped == 3, "malformed lines counted");
    ExpectTrue(pairs.size() == 3 && pairs[1].first == "tact" &&
                   pairs[1].second == 10,
               "comma separated entry");
    std::remove(path.c_str());

    ExpectFalse(platewise::LoadCorpusFile("does/not/exist.txt", &pairs,
                                          nullptr, &error),
                "missing corpus file fails");
    ExpectFalse(error.empty(), "missing corpus file reports an error");
  }

  return platewise_test::Finish("matcher_tests");
}
