#include "Scoring.hpp"
#include "TestHarness.hpp"

#include <cmath>

using platewise_test::ExpectFalse;
using platewise_test::ExpectNear;
using platewise_test::ExpectTrue;
using platewise_test::MakeCorpus;

namespace {
bool InBounds(const platewise::ScoreResult& result) {
  return result.score >= 0.0 && result.score <= 100.0;
}
}  // namespace

int main() {
  using platewise::ScoreStatus;

  {
    auto corpus = MakeCorpus(
        {{"common", 100}, {"middle", 50}, {"rare", 10}, {"zero", 0}});
    auto common = platewise::ScoreFrequency(*corpus, "common");
    auto middle = platewise::ScoreFrequency(*corpus, "MIDDLE");
    auto rare = platewise::ScoreFrequency(*corpus, "rare");
    ExpectTrue(common.ok() && middle.ok() && rare.ok(),
               "corpus words score");
    ExpectTrue(rare.score > middle.score && middle.score > common.score,
               "rarer words score higher");
    ExpectTrue(InBounds(common) && InBounds(middle) && InBounds(rare),
               "frequency scores within bounds");
    ExpectNear(common.MetricValue("inverse_frequency_score"), 0.0, 1e-9,
               "most frequent word has zero inverse score");
    ExpectNear(common.MetricValue("frequency_rank"), 1.0, 1e-12,
               "most frequent word ranks first");
    ExpectTrue(common.interpretation == "very common",
               "most frequent word reads as very common");
    ExpectTrue(common.dimension == platewise::kFrequencyDimension,
               "dimension recorded");

    auto missing = platewise::ScoreFrequency(*corpus, "absent");
    ExpectTrue(missing.status == ScoreStatus::kNotFound, "absent word");
    ExpectFalse(missing.error.empty(), "absent word explains itself");
    ExpectTrue(platewise::ScoreFrequency(*corpus, "zero").status ==
                   ScoreStatus::kNotFound,
               "zero-frequency word counts as absent");
    ExpectTrue(platewise::ScoreFrequency(*corpus, "c4t").status ==
                   ScoreStatus::kInvalidInput,
               "malformed word");
    ExpectTrue(platewise::ScoreFrequency(*corpus, "").status ==
                   ScoreStatus::kInvalidInput,
               "empty word");

    auto again = platewise::ScoreFrequency(*corpus, "rare");
    ExpectTrue(again.score == rare.score, "frequency scoring is deterministic");

    auto rarest = platewise::RarestWords(*corpus, 2);
    ExpectTrue(rarest.size() == 2 && rarest[0].word == "rare" &&
                   rarest[1].word == "middle",
               "rarest words skip zero frequencies");
    ExpectTrue(!rarest.empty() && std::fabs(rarest[0].combined_score -
                                            rare.score) < 1e-12,
               "rarest words carry the combined score");
  }

  {
    auto single = MakeCorpus({{"only", 5}});
    auto result = platewise::ScoreFrequency(*single, "only");
    ExpectTrue(result.ok() && InBounds(result), "single-word corpus scores");
    ExpectNear(result.MetricValue("z_score"), 0.0, 1e-12,
               "flat distribution has zero z-score");
  }

  auto corpus =
      MakeCorpus({{"act", 30}, {"tact", 10}, {"cat", 20}, {"dog", 40}});
  platewise::IndexBuildOptions options;
  options.pattern_length = 2;
  std::string error;
  auto index = platewise::BuildCorpusIndex(corpus, options, &error);
  ExpectTrue(index != nullptr, "index builds");
  if (!index) {
    return platewise_test::Finish("scorer_tests");
  }

  {
    auto result = platewise::ScoreInformation(*index, "tact", "AT");
    ExpectTrue(result.ok(), "solution scores");
    ExpectNear(result.MetricValue("information_bits"), std::log2(6.0), 1e-9,
               "bits from plate probability");
    ExpectNear(result.MetricValue("plate_total_frequency"), 60.0, 1e-12,
               "plate mass");
    ExpectNear(result.score, std::log2(6.0) / std::log2(60.0) * 100.0, 1e-9,
               "normalized information score");
    ExpectNear(result.MetricValue("percentile_in_plate"), 100.0, 1e-9,
               "rarest solution tops the plate");
    ExpectTrue(result.interpretation == "moderate information",
               "information interpretation");

    auto common = platewise::ScoreInformation(*index, "act", "at");
    ExpectTrue(common.ok() && common.score < result.score,
               "frequent solutions carry less information");
    ExpectTrue(InBounds(common), "information score within bounds");

    ExpectTrue(platewise::ScoreInformation(*index, "dog", "at").status ==
                   ScoreStatus::kNotASolution,
               "known word outside the solution set");
    ExpectTrue(platewise::ScoreInformation(*index, "zebra", "at").status ==
                   ScoreStatus::kNotFound,
               "unknown word");
    ExpectTrue(platewise::ScoreInformation(*index, "act", "a").status ==
                   ScoreStatus::kInvalidInput,
               "short plate");
    ExpectTrue(platewise::ScoreInformation(*index, "a-t", "at").status ==
                   ScoreStatus::kInvalidInput,
               "malformed word");

    auto top = platewise::TopWordsForPattern(*index, "at", 2);
    ExpectTrue(top.size() == 2 && top[0].word == "tact" && top[1].word == "cat",
               "top words ranked by information");
    ExpectTrue(platewise::TopWordsForPattern(*index, "qz", 5).empty(),
               "unsolvable plate has no top words");

    platewise::IndexSummary summary = platewise::SummarizeIndex(*index);
    ExpectTrue(summary.total_patterns == 676, "summary counts plates");
    ExpectTrue(summary.patterns_with_solutions == index->patterns_with_solutions(),
               "summary counts solvable plates");
    ExpectTrue(summary.min_information_bits <= summary.avg_information_bits &&
                   summary.avg_information_bits <= summary.max_information_bits,
               "summary bit range");
  }

  {
    platewise::IndexBuildOptions partial;
    partial.coverage = platewise::CoverageMode::kPartial;
    partial.sample_patterns = {"at"};
    auto sampled = platewise::BuildCorpusIndex(corpus, partial, &error);
    ExpectTrue(sampled != nullptr, "partial index builds");
    if (sampled) {
      ExpectTrue(platewise::ScoreInformation(*sampled, "dog", "dg").status ==
                     ScoreStatus::kUncoveredPattern,
                 "plate outside the sample");
      ExpectTrue(platewise::ScoreInformation(*sampled, "tact", "at").ok(),
                 "sampled plate scores");
    }
  }

  {
    const uint64_t half = uint64_t{1} << 63;
    auto heavy = MakeCorpus({{"big", half}, {"bag", half}});
    platewise::IndexBuildOptions heavy_options;
    heavy_options.coverage = platewise::CoverageMode::kPartial;
    heavy_options.sample_patterns = {"bg"};
    auto heavy_index = platewise::BuildCorpusIndex(heavy, heavy_options, &error);
    ExpectTrue(heavy_index != nullptr, "huge frequencies index");
    if (heavy_index) {
      auto result = platewise::ScoreInformation(*heavy_index, "big", "bg");
      ExpectTrue(result.ok(), "huge plate mass scores");
      ExpectNear(result.MetricValue("plate_total_frequency"), 2.0 * half,
                 1.0, "plate mass beyond 64 bits");
      ExpectNear(result.MetricValue("probability"), 0.5, 1e-12,
                 "probability stays within (0, 1]");
      ExpectNear(result.MetricValue("information_bits"), 1.0, 1e-12,
                 "one bit between two equal words");
      ExpectNear(result.score, 100.0 / 64.0, 1e-9,
                 "normalized against log2 of the full mass");
      auto top = platewise::TopWordsForPattern(*heavy_index, "bg", 5);
      ExpectTrue(top.size() == 2 && top[0].probability == 0.5,
                 "top words keep proper probabilities");
    }

    auto model = platewise::NGramModel::Build(*heavy);
    ExpectNear(model->BigramProbability("^b"), 0.25, 1e-12,
               "n-gram totals beyond 64 bits");
    ExpectNear(model->stats().total_bigrams, 8.0 * half, 1.0,
               "weighted bigram total");
  }

  {
    auto flat = MakeCorpus({{"aaa", 1000}});
    auto model = platewise::NGramModel::Build(*flat);
    ExpectTrue(model->stats().unique_bigrams == 3, "bigram table");
    ExpectTrue(model->stats().unique_trigrams == 3, "trigram table");
    ExpectTrue(model->stats().total_bigrams == 4000,
               "bigrams weighted by frequency");
    ExpectNear(model->BigramProbability("aa"), 0.5, 1e-12, "bigram probability");
    ExpectNear(model->TrigramProbability("zzz"),
               platewise::NGramModel::kUnseenProbability, 0.0,
               "unseen trigram floor");

    auto familiar = platewise::ScoreOrthographic(*model, "aaa");
    ExpectTrue(familiar.ok(), "corpus word scores");
    ExpectNear(familiar.score, 0.0, 1e-9, "familiar spelling scores zero");
    ExpectTrue(familiar.interpretation == "very low complexity",
               "low complexity interpretation");

    auto strange = platewise::ScoreOrthographic(*model, "zzz");
    ExpectTrue(strange.ok(), "words outside the corpus still score");
    ExpectNear(strange.score, 100.0, 1e-9, "unseen spelling scores maximal");
    ExpectTrue(strange.interpretation == "extremely high complexity",
               "high complexity interpretation");
    ExpectNear(strange.MetricValue("bigram_count"), 4.0, 1e-12,
               "padded bigram count");

    auto tiny = platewise::ScoreOrthographic(*model, "a");
    ExpectTrue(tiny.ok(), "one-letter word scores");
    ExpectNear(tiny.MetricValue("trigram_count"), 1.0, 1e-12,
               "one-letter word keeps its boundary trigram");
    ExpectNear(tiny.MetricValue("bigram_count"), 2.0, 1e-12,
               "one-letter word keeps both boundary bigrams");
    ExpectTrue(tiny.MetricValue("trigram_score") > 0.0,
               "boundary trigram contributes to the score");

    ExpectTrue(platewise::ScoreOrthographic(*model, "z z").status ==
                   ScoreStatus::kInvalidInput,
               "malformed word");

    auto details = platewise::OrthographicDetails(*model, "aaa", 2);
    ExpectTrue(details.size() == 4 && details[0].ngram == "^a",
               "bigram details include boundaries");
    if (!details.empty()) {
      ExpectNear(details[0].bits, 2.0, 1e-9, "start bigram surprisal");
    }
    ExpectTrue(platewise::OrthographicDetails(*model, "aaa", 4).empty(),
               "unsupported order");
  }

  {
    auto model = platewise::NGramModel::Build(*corpus);
    auto first = platewise::ScoreOrthographic(*model, "tact");
    auto second = platewise::ScoreOrthographic(*model, "tact");
    ExpectTrue(first.score == second.score,
               "orthographic scoring is deterministic");
    ExpectTrue(InBounds(first), "orthographic score within bounds");
    ExpectTrue(model->stats().top_bigrams.size() <=
                   platewise::NGramModel::kTopNGrams,
               "top bigrams capped");
  }

  return platewise_test::Finish("scorer_tests");
}
