#include "record_features.hpp"

#include "internal/normalize/normalizer.hpp"

namespace resolver::features {

std::vector<std::string> TextTokens(const resolver::v1::Record& record) {
  auto tokens      = normalize::Tokenize(record.title());
  auto description = normalize::Tokenize(record.description());
  tokens.insert(tokens.end(), description.begin(), description.end());
  return tokens;
}

FeatureExtractor::FeatureExtractor(const normalize::VariantGenerator& variants, const alias::AliasResolver& aliases)
    : variants_(variants), aliases_(aliases) {
}

RecordFeatures FeatureExtractor::Extract(const resolver::v1::Record& record, const similarity::TermStatistics& terms) const {
  RecordFeatures features;
  features.id               = record.id();
  features.source_key       = record.source_key();
  features.manufacturer_raw = record.manufacturer_raw();
  features.manufacturer     = aliases_.Canonicalize(record.manufacturer_raw());

  features.part_number = normalize::NormalizePartNumber(record.part_number_raw());
  features.variants    = variants_.Generate(features.part_number, features.manufacturer.identity);

  features.unspsc = normalize::NormalizeUnspsc(record.unspsc());
  features.gtin   = normalize::NormalizeGtin(record.gtin());

  features.title              = record.title();
  features.description        = record.description();
  features.title_tokens       = normalize::Tokenize(record.title());
  features.description_tokens = normalize::Tokenize(record.description());
  features.text_vector        = terms.Vectorize(TextTokens(record));
  return features;
}

} // namespace resolver::features
