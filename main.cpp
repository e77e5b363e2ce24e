#include "Scoring.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
struct Config {
  std::string corpus_path;
  std::string solve_pattern;
  std::string mode = "subsequence";
  std::string score_word;
  std::string plate;
  std::string weights;
  std::string top_words_plate;
  std::string features_word;
  std::string coverage = "full";
  std::string sample_plates;
  size_t plate_length = 3;
  size_t rarest = 0;
  size_t limit = 20;
  int threads = 0;
  bool renormalize = false;
  bool quiet = false;
};

void PrintUsage(const char* argv0) {
  std::cout
      << "Platewise: license-plate word game solver and scorer\n"
      << "Usage:\n"
      << "  " << argv0 << " --corpus WORDS.txt --solve PLATE [--mode MODE]\n"
      << "  " << argv0
      << " --corpus WORDS.txt --score WORD --plate PLATE [--weights F,I,O]\n"
      << "  " << argv0 << " --corpus WORDS.txt --top-words PLATE\n"
      << "  " << argv0 << " --corpus WORDS.txt --rarest N\n"
      << "  " << argv0 << " --corpus WORDS.txt --features WORD --plate PLATE\n"
      << "Options:\n"
      << "  --corpus PATH            Word list, one 'word frequency' per line\n"
      << "  --solve PLATE            List words matching PLATE\n"
      << "  --mode MODE              subsequence|substring|anagram|"
         "anagram_subset|pattern\n"
      << "  --score WORD             Score WORD against --plate\n"
      << "  --plate PLATE            Plate used by --score and --features\n"
      << "  --weights F,I,O          Ensemble weights (default equal)\n"
      << "  --renormalize            Rescale by the weights of working scorers\n"
      << "  --top-words PLATE        Most informative solutions for PLATE\n"
      << "  --rarest N               N lowest-frequency corpus words\n"
      << "  --features WORD          Feature vector for WORD on --plate\n"
      << "  --limit N                Rows printed by list commands (default 20)\n"
      << "  --plate-length N         Plate length for full coverage (default 3)\n"
      << "  --coverage full|partial  Index every plate or only --sample-plates\n"
      << "  --sample-plates A,B,...  Plates indexed in partial coverage\n"
      << "  --threads N              Index build threads (default: all)\n"
      << "  --quiet                  Suppress build progress\n";
}

std::vector<std::string> SplitCommas(const std::string& text) {
  std::vector<std::string> parts;
  std::stringstream ss(text);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

bool ParseWeights(const std::string& text, platewise::EnsembleWeights* out) {
  std::vector<std::string> parts = SplitCommas(text);
  if (parts.size() != 3) {
    return false;
  }
  try {
    out->frequency = std::stod(parts[0]);
    out->information = std::stod(parts[1]);
    out->orthographic = std::stod(parts[2]);
  } catch (const std::logic_error&) {
    return false;
  }
  return true;
}

void PrintResult(const platewise::ScoreResult& result) {
  std::cout << "[" << result.dimension << "] ";
  if (!result.ok()) {
    std::cout << platewise::ScoreStatusName(result.status) << ": "
              << result.error << "\n";
    return;
  }
  std::cout << std::fixed << std::setprecision(2) << result.score << " ("
            << result.interpretation << ")\n";
  for (const platewise::Metric& metric : result.metrics) {
    std::cout << "    " << std::left << std::setw(26) << metric.name
              << std::right << std::setprecision(4) << metric.value << "\n";
  }
}
}  // namespace

int main(int argc, char** argv) {
  Config config;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--corpus" && i + 1 < argc) {
        config.corpus_path = argv[++i];
      } else if (arg == "--solve" && i + 1 < argc) {
        config.solve_pattern = argv[++i];
      } else if (arg == "--mode" && i + 1 < argc) {
        config.mode = argv[++i];
      } else if (arg == "--score" && i + 1 < argc) {
        config.score_word = argv[++i];
      } else if (arg == "--plate" && i + 1 < argc) {
        config.plate = argv[++i];
      } else if (arg == "--weights" && i + 1 < argc) {
        config.weights = argv[++i];
      } else if (arg == "--renormalize") {
        config.renormalize = true;
      } else if (arg == "--top-words" && i + 1 < argc) {
        config.top_words_plate = argv[++i];
      } else if (arg == "--rarest" && i + 1 < argc) {
        config.rarest = static_cast<size_t>(std::stoul(argv[++i]));
      } else if (arg == "--features" && i + 1 < argc) {
        config.features_word = argv[++i];
      } else if (arg == "--limit" && i + 1 < argc) {
        config.limit = static_cast<size_t>(std::stoul(argv[++i]));
      } else if (arg == "--plate-length" && i + 1 < argc) {
        config.plate_length = static_cast<size_t>(std::stoul(argv[++i]));
      } else if (arg == "--coverage" && i + 1 < argc) {
        config.coverage = argv[++i];
      } else if (arg == "--sample-plates" && i + 1 < argc) {
        config.sample_plates = argv[++i];
      } else if (arg == "--threads" && i + 1 < argc) {
        config.threads = std::stoi(argv[++i]);
      } else if (arg == "--quiet") {
        config.quiet = true;
      } else if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else {
        std::cerr << "Unknown argument: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::logic_error& e) {
    std::cerr << "Invalid numeric argument: " << e.what() << "\n";
    return 1;
  }

  if (config.corpus_path.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::vector<std::pair<std::string, uint64_t>> pairs;
  size_t skipped = 0;
  std::string error;
  if (!platewise::LoadCorpusFile(config.corpus_path, &pairs, &skipped,
                                 &error)) {
    std::cerr << "Failed to load corpus: " << error << "\n";
    return 1;
  }
  size_t rejected = 0;
  std::shared_ptr<const platewise::Corpus> corpus =
      platewise::Corpus::Create(pairs, &rejected);
  if (!config.quiet) {
    std::cout << "Loaded " << corpus->size() << " words";
    if (skipped > 0 || rejected > 0) {
      std::cout << " (" << skipped << " malformed lines, " << rejected
                << " invalid words skipped)";
    }
    std::cout << "\n";
  }

  bool ran_any = false;

  if (!config.solve_pattern.empty()) {
    platewise::MatchMode mode;
    if (!platewise::ParseMatchMode(config.mode, &mode)) {
      std::cerr << "Unknown match mode: " << config.mode << "\n";
      return 1;
    }
    std::string normalized;
    if (!platewise::Corpus::NormalizePattern(config.solve_pattern, mode,
                                             &normalized)) {
      std::cerr << "Invalid plate for " << platewise::MatchModeName(mode)
                << " mode: " << config.solve_pattern << " (expected "
                << platewise::kMinPatternLength << "-"
                << platewise::kMaxPatternLength << " letters"
                << (mode == platewise::MatchMode::kPositional ? " or '?'" : "")
                << ")\n";
      return 1;
    }
    auto start = std::chrono::high_resolution_clock::now();
    std::vector<platewise::WordFrequency> solutions =
        platewise::Solve(*corpus, normalized, mode);
    auto end = std::chrono::high_resolution_clock::now();
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start)
            .count();

    std::cout << "\n[Solve " << platewise::Corpus::DisplayPattern(
                                    config.solve_pattern)
              << " / " << platewise::MatchModeName(mode) << "]\n";
    std::cout << "Matches: " << solutions.size() << "\n";
    for (size_t i = 0; i < solutions.size() && i < config.limit; ++i) {
      std::cout << "  " << std::left << std::setw(20) << solutions[i].word
                << std::right << solutions[i].frequency << "\n";
    }
    std::cout << "Compute latency: " << micros << "us\n";
    ran_any = true;
  }

  if (config.rarest > 0) {
    std::cout << "\n[Rarest words]\n";
    for (const platewise::RareWord& rare :
         platewise::RarestWords(*corpus, config.rarest)) {
      std::cout << "  " << std::left << std::setw(20) << rare.word << std::right
                << std::setw(12) << rare.frequency << "  score=" << std::fixed
                << std::setprecision(2) << rare.combined_score << "\n";
    }
    ran_any = true;
  }

  const bool needs_index = !config.score_word.empty() ||
                           !config.top_words_plate.empty() ||
                           !config.features_word.empty();
  if (needs_index) {
    platewise::IndexBuildOptions options;
    if (!platewise::ParseCoverageMode(config.coverage, &options.coverage)) {
      std::cerr << "Unknown coverage mode: " << config.coverage << "\n";
      return 1;
    }
    options.pattern_length = config.plate_length;
    options.threads = config.threads;
    options.log = config.quiet ? nullptr : &std::cout;
    if (options.coverage == platewise::CoverageMode::kPartial) {
      options.sample_patterns = SplitCommas(config.sample_plates);
      for (const std::string* extra :
           {&config.plate, &config.top_words_plate}) {
        if (!extra->empty()) {
          options.sample_patterns.push_back(*extra);
        }
      }
    }

    platewise::ScoringEngine engine;
    if (!engine.Rebuild(corpus, options, &error)) {
      std::cerr << "Failed to build plate index: " << error << "\n";
      return 1;
    }
    auto snapshot = engine.snapshot();

    if (!config.score_word.empty()) {
      if (config.plate.empty()) {
        std::cerr << "--score requires --plate.\n";
        return 1;
      }
      platewise::EnsembleWeights weights;
      if (!config.weights.empty() && !ParseWeights(config.weights, &weights)) {
        std::cerr << "Invalid --weights: " << config.weights << "\n";
        return 1;
      }
      platewise::EnsembleOptions ensemble_options;
      ensemble_options.renormalize_missing = config.renormalize;

      auto start = std::chrono::high_resolution_clock::now();
      platewise::EnsembleResult result =
          engine.Score(config.score_word, config.plate, weights,
                       ensemble_options);
      auto end = std::chrono::high_resolution_clock::now();
      auto micros =
          std::chrono::duration_cast<std::chrono::microseconds>(end - start)
              .count();

      std::cout << "\n[Score " << result.word << " on "
                << platewise::Corpus::DisplayPattern(result.pattern) << "]\n";
      if (result.status == platewise::ScoreStatus::kInvalidInput) {
        std::cerr << "Invalid input: " << result.error << "\n";
        return 1;
      }
      PrintResult(result.frequency);
      PrintResult(result.information);
      PrintResult(result.orthographic);
      std::cout << "Weights: " << std::fixed << std::setprecision(3)
                << result.weights.frequency << ", "
                << result.weights.information << ", "
                << result.weights.orthographic << "\n";
      if (result.ok()) {
        std::cout << "Ensemble score: " << std::setprecision(2)
                  << result.score << "\n";
      } else {
        std::cout << "Ensemble: " << platewise::ScoreStatusName(result.status)
                  << "\n";
      }
      std::cout << "Confidence: " << result.working_components << "/3\n";
      std::cout << "Compute latency: " << micros << "us\n";
      ran_any = true;
    }

    if (!config.top_words_plate.empty()) {
      std::vector<platewise::WordInformation> top =
          platewise::TopWordsForPattern(*snapshot->index,
                                        config.top_words_plate, config.limit);
      std::cout << "\n[Top words for "
                << platewise::Corpus::DisplayPattern(config.top_words_plate)
                << "]\n";
      if (top.empty()) {
        std::cout << "No indexed solutions.\n";
      }
      for (const platewise::WordInformation& info : top) {
        std::cout << "  " << std::left << std::setw(20) << info.word
                  << std::right << std::fixed << std::setprecision(3)
                  << info.information_bits << " bits  p=" << std::setprecision(6)
                  << info.probability << "\n";
      }
      ran_any = true;
    }

    if (!config.features_word.empty()) {
      if (config.plate.empty()) {
        std::cerr << "--features requires --plate.\n";
        return 1;
      }
      platewise::FeatureExtractor extractor(snapshot->index);
      Eigen::VectorXd features;
      platewise::ScoreStatus status;
      if (!extractor.Extract(config.features_word, config.plate, &features,
                             &status)) {
        std::cerr << "Feature extraction failed: "
                  << platewise::ScoreStatusName(status) << "\n";
        return 1;
      }
      const std::vector<std::string>& names =
          platewise::FeatureExtractor::FeatureNames();
      std::cout << "\n[Features " << config.features_word << " on "
                << platewise::Corpus::DisplayPattern(config.plate) << "]\n";
      for (size_t i = 0; i < names.size(); ++i) {
        std::cout << "  " << std::left << std::setw(24) << names[i]
                  << std::right << std::fixed << std::setprecision(4)
                  << features[static_cast<Eigen::Index>(i)] << "\n";
      }
      ran_any = true;
    }

    if (!config.quiet) {
      platewise::IndexSummary summary =
          platewise::SummarizeIndex(*snapshot->index);
      std::cout << "\nIndex: " << summary.patterns_with_solutions << "/"
                << summary.total_patterns << " plates solvable, avg entropy "
                << std::fixed << std::setprecision(3)
                << summary.avg_pattern_entropy << " bits\n";
    }
  }

  if (!ran_any) {
    PrintUsage(argv[0]);
    return 1;
  }
  return 0;
}
