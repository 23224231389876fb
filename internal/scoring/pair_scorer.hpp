#pragma once

#include <cstddef>

#include "internal/features/record_features.hpp"
#include "resolver/v1/types.pb.h"

namespace resolver::scoring {

struct ScoringWeights {
  double part_number  = 0.30;
  double manufacturer = 0.15;
  double text         = 0.15;
  double unspsc       = 0.10;
  double gtin         = 0.30;

  double Sum() const {
    return part_number + manufacturer + text + unspsc + gtin;
  }
};

struct ScoringOptions {
  ScoringWeights weights;

  // synergy bonus
  double      strong_threshold       = 0.8;
  double      synergy_bonus          = 0.10;
  std::size_t synergy_min_components = 3;

  // part number sub-score
  double exact_variant_score = 0.9;
  double suffix_only_score   = 0.9;
  double jaro_winkler_weight = 0.5;
  double levenshtein_weight  = 0.5;

  // text sub-score
  double title_jaccard_weight       = 0.3;
  double description_jaccard_weight = 0.2;
  double tfidf_weight               = 0.5;
};

// Throws util::InvalidArgument on negative or non-finite values and on weight
// groups summing above 1.
void ValidateScoringOptions(const ScoringOptions& options);

/*
  PairScorer

  Five components, each in [0, 1] or not applicable:

    part number   1.0 when the normalized originals are equal, else
                  max(exact_variant_score if any variant is shared,
                      suffix_only_score if two variants differ by a unit suffix,
                      jw_weight * best JW + lev_weight * best Levenshtein similarity)
    manufacturer  1.0 on equal canonical identity, else JW of the identities
    text          title Jaccard, description Jaccard, TF-IDF cosine
    unspsc        shared prefix depth: 8 / 6 / 4 / 2 digits -> 1 / .75 / .5 / .25
    gtin          1.0 when both present and equal; a mismatch is flagged only

  overall = clamp(sum(weight * score over applicable components) + bonus, 0, 1)
  where the bonus applies when at least synergy_min_components applicable
  components reach strong_threshold.

  Score() always works on the pair ordered by id, so Score(a, b) and
  Score(b, a) return the same message.
*/
class PairScorer {
 public:
  explicit PairScorer(ScoringOptions options = {});

  resolver::v1::PairScore Score(const features::RecordFeatures& a, const features::RecordFeatures& b) const;

  const ScoringOptions& options() const {
    return options_;
  }

 private:
  void ScorePartNumber(const features::RecordFeatures& a, const features::RecordFeatures& b,
                       resolver::v1::PartNumberComparison* out) const;
  void ScoreManufacturer(const features::RecordFeatures& a, const features::RecordFeatures& b,
                         resolver::v1::ManufacturerComparison* out) const;
  void ScoreText(const features::RecordFeatures& a, const features::RecordFeatures& b, resolver::v1::TextComparison* out) const;

  ScoringOptions options_;
};

resolver::v1::UnspscTier UnspscMatchTier(const std::string& a, const std::string& b);
double                   UnspscTierScore(resolver::v1::UnspscTier tier);

// Breakdown with the a/b sides exchanged; scores are untouched.
resolver::v1::Comparison SwapSides(const resolver::v1::Comparison& comparison);

} // namespace resolver::scoring
