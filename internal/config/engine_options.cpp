#include "engine_options.hpp"

#include <cmath>
#include <filesystem>

#include "internal/util/errors.hpp"

namespace resolver::config {

namespace {

void RequireUnitInterval(double value, const char* name) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
    throw util::InvalidArgument(std::string(name) + " must be within [0, 1]");
  }
}

blocking::OverflowPolicy ToPolicy(resolver::runtime::config::OverflowPolicy policy) {
  switch (policy) {
    case resolver::runtime::config::OVERFLOW_POLICY_SKIP:
      return blocking::OverflowPolicy::kSkip;
    case resolver::runtime::config::OVERFLOW_POLICY_SAMPLE:
    case resolver::runtime::config::OVERFLOW_POLICY_UNSPECIFIED:
      return blocking::OverflowPolicy::kSample;
    default:
      throw util::InvalidArgument("unknown blocking.overflow_policy");
  }
}

} // namespace

EngineOptions EngineOptions::FromConfig(const resolver::runtime::config::RuntimeConfig& config, const std::string& base_dir) {
  EngineOptions options;

  // ------------------------------------------------------------------
  // Normalization / aliases
  // ------------------------------------------------------------------
  if (config.normalization().has_max_variants()) {
    options.max_variants = config.normalization().max_variants();
  }

  const auto& aliases = config.aliases();
  if (!aliases.path().empty()) {
    std::filesystem::path path(aliases.path());
    if (path.is_relative() && !base_dir.empty()) {
      path = std::filesystem::path(base_dir) / path;
    }
    options.alias_path = path.string();
  }
  for (const auto& entry : aliases.entries()) {
    alias::AliasEntry out;
    out.canonical = entry.canonical();
    out.aliases.assign(entry.aliases().begin(), entry.aliases().end());
    out.subsidiaries.assign(entry.subsidiaries().begin(), entry.subsidiaries().end());
    out.brands.assign(entry.brands().begin(), entry.brands().end());
    options.alias_entries.push_back(std::move(out));
  }
  if (aliases.has_fuzzy_threshold()) options.alias_resolver.fuzzy_threshold = aliases.fuzzy_threshold();
  if (aliases.has_include_subsidiaries()) options.alias_table.include_subsidiaries = aliases.include_subsidiaries();
  if (aliases.has_include_brands()) options.alias_table.include_brands = aliases.include_brands();

  // ------------------------------------------------------------------
  // Blocking
  // ------------------------------------------------------------------
  const auto& blocking = config.blocking();
  auto&       b        = options.blocking;
  if (blocking.has_unspsc_prefix_length()) b.unspsc_prefix_length = blocking.unspsc_prefix_length();
  if (blocking.has_overflow_cap()) b.overflow_cap = blocking.overflow_cap();
  if (blocking.has_max_bucket_size()) b.max_bucket_size = blocking.max_bucket_size();
  b.overflow_policy = ToPolicy(blocking.overflow_policy());
  if (blocking.has_sample_pairs()) b.sample_pairs = blocking.sample_pairs();
  if (blocking.has_sample_seed()) b.sample_seed = blocking.sample_seed();
  if (blocking.has_gtin_pass()) b.gtin_pass = blocking.gtin_pass();

  // ------------------------------------------------------------------
  // Scoring
  // ------------------------------------------------------------------
  const auto& scoring = config.scoring();
  auto&       s       = options.scoring;
  const auto& weights = scoring.weights();
  if (weights.has_part_number()) s.weights.part_number = weights.part_number();
  if (weights.has_manufacturer()) s.weights.manufacturer = weights.manufacturer();
  if (weights.has_text()) s.weights.text = weights.text();
  if (weights.has_unspsc()) s.weights.unspsc = weights.unspsc();
  if (weights.has_gtin()) s.weights.gtin = weights.gtin();

  if (scoring.has_strong_threshold()) s.strong_threshold = scoring.strong_threshold();
  if (scoring.has_synergy_bonus()) s.synergy_bonus = scoring.synergy_bonus();
  if (scoring.has_synergy_min_components()) s.synergy_min_components = scoring.synergy_min_components();
  if (scoring.has_exact_variant_score()) s.exact_variant_score = scoring.exact_variant_score();
  if (scoring.has_suffix_only_score()) s.suffix_only_score = scoring.suffix_only_score();
  if (scoring.has_jaro_winkler_weight()) s.jaro_winkler_weight = scoring.jaro_winkler_weight();
  if (scoring.has_levenshtein_weight()) s.levenshtein_weight = scoring.levenshtein_weight();
  if (scoring.has_title_jaccard_weight()) s.title_jaccard_weight = scoring.title_jaccard_weight();
  if (scoring.has_description_jaccard_weight()) s.description_jaccard_weight = scoring.description_jaccard_weight();
  if (scoring.has_tfidf_weight()) s.tfidf_weight = scoring.tfidf_weight();

  // ------------------------------------------------------------------
  // Clustering / workers
  // ------------------------------------------------------------------
  if (config.clustering().has_threshold()) options.clustering.threshold = config.clustering().threshold();
  if (config.workers().has_threads()) options.threads = config.workers().threads();

  options.Validate();
  return options;
}

void EngineOptions::Validate() const {
  if (max_variants == 0) {
    throw util::InvalidArgument("normalization.max_variants must be at least 1");
  }

  RequireUnitInterval(alias_resolver.fuzzy_threshold, "aliases.fuzzy_threshold");
  for (const auto& entry : alias_entries) {
    if (entry.canonical.empty()) {
      throw util::InvalidArgument("aliases.entries: canonical name is required");
    }
  }

  if (blocking.unspsc_prefix_length < 1 || blocking.unspsc_prefix_length > 8) {
    throw util::InvalidArgument("blocking.unspsc_prefix_length must be within [1, 8]");
  }
  if (blocking.overflow_cap == 0) {
    throw util::InvalidArgument("blocking.overflow_cap must be at least 1");
  }
  if (blocking.overflow_policy == blocking::OverflowPolicy::kSample && blocking.sample_pairs == 0) {
    throw util::InvalidArgument("blocking.sample_pairs must be at least 1 with the sample policy");
  }

  scoring::ValidateScoringOptions(scoring);
  RequireUnitInterval(clustering.threshold, "clustering.threshold");
}

alias::AliasTable EngineOptions::BuildAliasTable() const {
  auto table = alias_path.empty() ? alias::AliasTable(alias_table) : alias::AliasTable::LoadYamlFile(alias_path, alias_table);
  for (const auto& entry : alias_entries) {
    table.AddEntry(entry);
  }
  return table;
}

} // namespace resolver::config
