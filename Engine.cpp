#include "Scoring.hpp"

#include <atomic>

namespace platewise {
namespace {
ScoreResult NotReady(const char* dimension) {
  ScoreResult result;
  result.dimension = dimension;
  result.status = ScoreStatus::kInvalidInput;
  result.error = "scoring engine has no corpus loaded";
  return result;
}
}  // namespace

bool ScoringEngine::Rebuild(std::shared_ptr<const Corpus> corpus,
                            const IndexBuildOptions& options,
                            std::string* error) {
  if (!corpus) {
    if (error) {
      *error = "no corpus to index";
    }
    return false;
  }
  std::shared_ptr<const CorpusIndex> index =
      BuildCorpusIndex(corpus, options, error);
  if (!index) {
    return false;
  }
  auto snapshot = std::make_shared<Snapshot>();
  snapshot->corpus = corpus;
  snapshot->index = std::move(index);
  snapshot->ngrams = NGramModel::Build(*corpus);
  Publish(std::move(snapshot));
  return true;
}

void ScoringEngine::Publish(std::shared_ptr<const Snapshot> snapshot) {
  std::atomic_store(&snapshot_, std::move(snapshot));
}

std::shared_ptr<const ScoringEngine::Snapshot> ScoringEngine::snapshot() const {
  return std::atomic_load(&snapshot_);
}

std::vector<WordFrequency> ScoringEngine::Solve(std::string_view pattern,
                                                MatchMode mode) const {
  auto snap = snapshot();
  if (!snap) {
    return {};
  }
  return platewise::Solve(*snap->corpus, pattern, mode);
}

ScoreResult ScoringEngine::ScoreFrequency(std::string_view word) const {
  auto snap = snapshot();
  if (!snap) {
    return NotReady(kFrequencyDimension);
  }
  return platewise::ScoreFrequency(*snap->corpus, word);
}

ScoreResult ScoringEngine::ScoreInformation(std::string_view word,
                                            std::string_view pattern) const {
  auto snap = snapshot();
  if (!snap) {
    return NotReady(kInformationDimension);
  }
  return platewise::ScoreInformation(*snap->index, word, pattern);
}

ScoreResult ScoringEngine::ScoreOrthographic(std::string_view word) const {
  auto snap = snapshot();
  if (!snap) {
    return NotReady(kOrthographicDimension);
  }
  return platewise::ScoreOrthographic(*snap->ngrams, word);
}

EnsembleResult ScoringEngine::Score(std::string_view word,
                                    std::string_view pattern,
                                    const EnsembleWeights& weights,
                                    const EnsembleOptions& options) const {
  auto snap = snapshot();
  if (!snap) {
    EnsembleResult result;
    result.word = std::string(word);
    result.pattern = std::string(pattern);
    result.status = ScoreStatus::kAllFailed;
    result.error = "scoring engine has no corpus loaded";
    return result;
  }
  return ScoreEnsemble(*snap->corpus, *snap->index, *snap->ngrams, word,
                       pattern, weights, options);
}

}  // namespace platewise
