#include "pair_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/normalize/variant_generator.hpp"
#include "internal/similarity/string_metrics.hpp"
#include "internal/util/errors.hpp"

namespace resolver::scoring {
namespace {

constexpr double kWeightTolerance = 1e-9;

void RequireUnit(double value, const char* name) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
    throw util::InvalidArgument(std::string("scoring: ") + name + " must be within [0, 1]");
  }
}

void RequireGroup(std::initializer_list<double> weights, const char* name) {
  double sum = 0.0;
  for (double w : weights) {
    if (!std::isfinite(w) || w < 0.0) {
      throw util::InvalidArgument(std::string("scoring: ") + name + " weights must be non-negative");
    }
    sum += w;
  }
  if (sum > 1.0 + kWeightTolerance) {
    throw util::InvalidArgument(std::string("scoring: ") + name + " weights sum above 1");
  }
}

// "14NV4111" vs "14NV4111EA" or "BR120" vs "BR120-A".
bool DiffersBySuffixOnly(const std::string& a, const std::string& b) {
  const auto& longer  = a.size() > b.size() ? a : b;
  const auto& shorter = a.size() > b.size() ? b : a;
  if (shorter.empty() || longer.size() == shorter.size() || longer.compare(0, shorter.size(), shorter) != 0) return false;
  return normalize::IsUnitSuffix(std::string_view(longer).substr(shorter.size()));
}

std::size_t SharedPrefix(const std::string& a, const std::string& b) {
  std::size_t n = 0;
  while (n < a.size() && n < b.size() && a[n] == b[n]) ++n;
  return n;
}

} // namespace

void ValidateScoringOptions(const ScoringOptions& options) {
  const auto& w = options.weights;
  RequireGroup({w.part_number, w.manufacturer, w.text, w.unspsc, w.gtin}, "component");
  RequireGroup({options.jaro_winkler_weight, options.levenshtein_weight}, "part number");
  RequireGroup({options.title_jaccard_weight, options.description_jaccard_weight, options.tfidf_weight}, "text");
  RequireUnit(options.strong_threshold, "strong_threshold");
  RequireUnit(options.synergy_bonus, "synergy_bonus");
  RequireUnit(options.exact_variant_score, "exact_variant_score");
  RequireUnit(options.suffix_only_score, "suffix_only_score");
}

resolver::v1::UnspscTier UnspscMatchTier(const std::string& a, const std::string& b) {
  const auto shared = SharedPrefix(a, b);
  if (shared >= 8) return resolver::v1::UNSPSC_TIER_COMMODITY;
  if (shared >= 6) return resolver::v1::UNSPSC_TIER_CLASS;
  if (shared >= 4) return resolver::v1::UNSPSC_TIER_FAMILY;
  if (shared >= 2) return resolver::v1::UNSPSC_TIER_SEGMENT;
  return resolver::v1::UNSPSC_TIER_NONE;
}

double UnspscTierScore(resolver::v1::UnspscTier tier) {
  switch (tier) {
    case resolver::v1::UNSPSC_TIER_COMMODITY:
      return 1.0;
    case resolver::v1::UNSPSC_TIER_CLASS:
      return 0.75;
    case resolver::v1::UNSPSC_TIER_FAMILY:
      return 0.5;
    case resolver::v1::UNSPSC_TIER_SEGMENT:
      return 0.25;
    default:
      return 0.0;
  }
}

PairScorer::PairScorer(ScoringOptions options) : options_(options) {
  ValidateScoringOptions(options_);
}

// ------------------------------------------------------------
// Components
// ------------------------------------------------------------

void PairScorer::ScorePartNumber(const features::RecordFeatures& a, const features::RecordFeatures& b,
                                 resolver::v1::PartNumberComparison* out) const {
  for (const auto& v : a.variants) out->add_variants_a(v);
  for (const auto& v : b.variants) out->add_variants_b(v);

  out->set_applicable(!a.part_number.empty() && !b.part_number.empty());
  if (!out->applicable()) return;

  if (a.part_number == b.part_number) {
    out->set_originals_equal(true);
    out->set_exact_match(true);
    out->set_matched_variant_a(a.part_number);
    out->set_matched_variant_b(b.part_number);
    out->set_jaro_winkler(1.0);
    out->set_levenshtein_similarity(1.0);
    out->set_score(1.0);
    return;
  }

  bool        exact        = false;
  double      best_jw      = 0.0;
  double      best_lev     = 0.0;
  double      best_blend   = -1.0;
  std::size_t best_a       = 0;
  std::size_t best_b       = 0;
  bool        exact_chosen = false;
  bool        suffix_only  = false;

  for (std::size_t i = 0; i < a.variants.size(); ++i) {
    for (std::size_t j = 0; j < b.variants.size(); ++j) {
      const auto& va = a.variants[i];
      const auto& vb = b.variants[j];
      if (va == vb && !exact) {
        exact        = true;
        exact_chosen = true;
        best_a       = i;
        best_b       = j;
      }
      if (!suffix_only && DiffersBySuffixOnly(va, vb)) suffix_only = true;
      const double jw    = similarity::JaroWinkler(va, vb);
      const double lev   = similarity::LevenshteinSimilarity(va, vb);
      const double blend = options_.jaro_winkler_weight * jw + options_.levenshtein_weight * lev;
      best_jw            = std::max(best_jw, jw);
      best_lev           = std::max(best_lev, lev);
      if (!exact_chosen && blend > best_blend) {
        best_blend = blend;
        best_a     = i;
        best_b     = j;
      }
    }
  }

  const double blended = options_.jaro_winkler_weight * best_jw + options_.levenshtein_weight * best_lev;
  const double matched = std::max(exact ? options_.exact_variant_score : 0.0, suffix_only ? options_.suffix_only_score : 0.0);
  const double score   = std::clamp(std::max(matched, blended), 0.0, 1.0);

  out->set_exact_match(exact);
  out->set_suffix_only(suffix_only);
  out->set_matched_variant_a(a.variants[best_a]);
  out->set_matched_variant_b(b.variants[best_b]);
  out->set_jaro_winkler(best_jw);
  out->set_levenshtein_similarity(best_lev);
  out->set_score(score);
}

void PairScorer::ScoreManufacturer(const features::RecordFeatures& a, const features::RecordFeatures& b,
                                   resolver::v1::ManufacturerComparison* out) const {
  out->set_raw_a(a.manufacturer_raw);
  out->set_raw_b(b.manufacturer_raw);
  out->set_canonical_a(a.manufacturer.identity);
  out->set_canonical_b(b.manufacturer.identity);

  out->set_applicable(!a.manufacturer.empty() && !b.manufacturer.empty());
  if (!out->applicable()) return;

  if (a.manufacturer.identity == b.manufacturer.identity) {
    out->set_similarity(1.0);
  } else {
    out->set_similarity(similarity::JaroWinkler(a.manufacturer.identity, b.manufacturer.identity));
  }
}

void PairScorer::ScoreText(const features::RecordFeatures& a, const features::RecordFeatures& b,
                           resolver::v1::TextComparison* out) const {
  const bool a_has_text = !a.title_tokens.empty() || !a.description_tokens.empty();
  const bool b_has_text = !b.title_tokens.empty() || !b.description_tokens.empty();
  out->set_applicable(a_has_text && b_has_text);
  if (!out->applicable()) return;

  out->set_title_jaccard(similarity::Jaccard(a.title_tokens, b.title_tokens));
  out->set_description_jaccard(similarity::Jaccard(a.description_tokens, b.description_tokens));
  out->set_tfidf_cosine(similarity::CosineSimilarity(a.text_vector, b.text_vector));

  const double score = options_.title_jaccard_weight * out->title_jaccard() +
                       options_.description_jaccard_weight * out->description_jaccard() +
                       options_.tfidf_weight * out->tfidf_cosine();
  out->set_score(std::clamp(score, 0.0, 1.0));
}

// ------------------------------------------------------------
// Score
// ------------------------------------------------------------

resolver::v1::PairScore PairScorer::Score(const features::RecordFeatures& first, const features::RecordFeatures& second) const {
  const bool  ordered = first.id <= second.id;
  const auto& a       = ordered ? first : second;
  const auto& b       = ordered ? second : first;
  const auto& w       = options_.weights;

  resolver::v1::PairScore result;
  result.set_id_a(a.id);
  result.set_id_b(b.id);
  auto* comparison = result.mutable_comparison();

  double      weighted = 0.0;
  std::size_t strong   = 0;
  auto        tally    = [&](double score) {
    if (score >= options_.strong_threshold) ++strong;
  };

  auto* part_number = comparison->mutable_part_number();
  ScorePartNumber(a, b, part_number);
  if (part_number->applicable()) {
    part_number->set_contribution(w.part_number * part_number->score());
    weighted += part_number->contribution();
    tally(part_number->score());
  }

  auto* manufacturer = comparison->mutable_manufacturer();
  ScoreManufacturer(a, b, manufacturer);
  if (manufacturer->applicable()) {
    manufacturer->set_contribution(w.manufacturer * manufacturer->similarity());
    weighted += manufacturer->contribution();
    tally(manufacturer->similarity());
  }

  auto* text = comparison->mutable_text();
  ScoreText(a, b, text);
  if (text->applicable()) {
    text->set_contribution(w.text * text->score());
    weighted += text->contribution();
    tally(text->score());
  }

  if (a.unspsc && b.unspsc) {
    auto* unspsc = comparison->mutable_unspsc();
    unspsc->set_code_a(*a.unspsc);
    unspsc->set_code_b(*b.unspsc);
    unspsc->set_tier(UnspscMatchTier(*a.unspsc, *b.unspsc));
    unspsc->set_score(UnspscTierScore(unspsc->tier()));
    unspsc->set_contribution(w.unspsc * unspsc->score());
    weighted += unspsc->contribution();
    tally(unspsc->score());
  }

  if (a.gtin && b.gtin) {
    if (*a.gtin == *b.gtin) {
      auto* gtin = comparison->mutable_gtin();
      gtin->set_gtin_a(*a.gtin);
      gtin->set_gtin_b(*b.gtin);
      gtin->set_equal(true);
      gtin->set_score(1.0);
      gtin->set_contribution(w.gtin);
      weighted += gtin->contribution();
      tally(gtin->score());
    } else {
      comparison->set_gtin_mismatch(true);
    }
  }

  auto* synergy = comparison->mutable_synergy();
  synergy->set_strong_components(static_cast<std::int32_t>(strong));
  double bonus = 0.0;
  if (strong >= options_.synergy_min_components) {
    bonus = options_.synergy_bonus;
    synergy->set_applied(true);
    synergy->set_contribution(bonus);
  }

  result.set_weighted_sum(weighted);
  result.set_overall_score(std::clamp(weighted + bonus, 0.0, 1.0));
  return result;
}

// ------------------------------------------------------------
// Orientation
// ------------------------------------------------------------

resolver::v1::Comparison SwapSides(const resolver::v1::Comparison& comparison) {
  resolver::v1::Comparison swapped = comparison;

  auto* part_number = swapped.mutable_part_number();
  part_number->mutable_variants_a()->Swap(part_number->mutable_variants_b());
  std::swap(*part_number->mutable_matched_variant_a(), *part_number->mutable_matched_variant_b());

  auto* manufacturer = swapped.mutable_manufacturer();
  std::swap(*manufacturer->mutable_raw_a(), *manufacturer->mutable_raw_b());
  std::swap(*manufacturer->mutable_canonical_a(), *manufacturer->mutable_canonical_b());

  if (swapped.has_unspsc()) {
    std::swap(*swapped.mutable_unspsc()->mutable_code_a(), *swapped.mutable_unspsc()->mutable_code_b());
  }
  if (swapped.has_gtin()) {
    std::swap(*swapped.mutable_gtin()->mutable_gtin_a(), *swapped.mutable_gtin()->mutable_gtin_b());
  }
  return swapped;
}

} // namespace resolver::scoring
