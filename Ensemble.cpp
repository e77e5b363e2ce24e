#include "Scoring.hpp"

#include <algorithm>
#include <cmath>

namespace platewise {
namespace {
constexpr int kComponentCount = 3;

bool ValidWeight(double weight) {
  return std::isfinite(weight) && weight >= 0.0;
}
}  // namespace

const char* ScoreStatusName(ScoreStatus status) {
  switch (status) {
    case ScoreStatus::kOk:
      return "ok";
    case ScoreStatus::kInvalidInput:
      return "invalid_input";
    case ScoreStatus::kNotFound:
      return "not_found";
    case ScoreStatus::kUncoveredPattern:
      return "uncovered_plate";
    case ScoreStatus::kNotASolution:
      return "not_a_solution";
    case ScoreStatus::kAllFailed:
      return "all_failed";
  }
  return "unknown";
}

double ScoreResult::MetricValue(std::string_view name, double fallback) const {
  for (const Metric& metric : metrics) {
    if (metric.name == name) {
      return metric.value;
    }
  }
  return fallback;
}

EnsembleResult ScoreEnsemble(const Corpus& corpus,
                             const CorpusIndex& index,
                             const NGramModel& model,
                             std::string_view word,
                             std::string_view pattern,
                             const EnsembleWeights& weights,
                             const EnsembleOptions& options) {
  EnsembleResult result;
  result.word = std::string(word);
  result.pattern = std::string(pattern);

  if (!ValidWeight(weights.frequency) || !ValidWeight(weights.information) ||
      !ValidWeight(weights.orthographic)) {
    result.status = ScoreStatus::kInvalidInput;
    result.error = "weights must be finite and non-negative";
    return result;
  }
  const double sum =
      weights.frequency + weights.information + weights.orthographic;
  if (!(sum > 0.0) || !std::isfinite(sum)) {
    result.status = ScoreStatus::kInvalidInput;
    result.error = "weights must have a positive sum";
    return result;
  }
  result.weights.frequency = weights.frequency / sum;
  result.weights.information = weights.information / sum;
  result.weights.orthographic = weights.orthographic / sum;

  result.frequency = ScoreFrequency(corpus, word);
  result.information = ScoreInformation(index, word, pattern);
  result.orthographic = ScoreOrthographic(model, word);

  const std::pair<const ScoreResult*, double> components[kComponentCount] = {
      {&result.frequency, result.weights.frequency},
      {&result.information, result.weights.information},
      {&result.orthographic, result.weights.orthographic},
  };
  double total = 0.0;
  double working_weight = 0.0;
  for (const auto& component : components) {
    if (!component.first->ok()) {
      continue;
    }
    total += component.first->score * component.second;
    working_weight += component.second;
    ++result.working_components;
  }

  result.confidence = static_cast<double>(result.working_components) /
                      static_cast<double>(kComponentCount);
  if (result.working_components == 0) {
    result.status = ScoreStatus::kAllFailed;
    result.error = "all scorers failed";
    return result;
  }
  if (options.renormalize_missing && working_weight > 0.0) {
    total /= working_weight;
  }
  result.score = std::max(0.0, std::min(100.0, total));
  return result;
}

}  // namespace platewise
