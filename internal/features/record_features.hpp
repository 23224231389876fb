#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/alias/alias_resolver.hpp"
#include "internal/normalize/variant_generator.hpp"
#include "internal/similarity/term_statistics.hpp"
#include "resolver/v1/types.pb.h"

namespace resolver::features {

/*
  Everything the blocker and the scorer need from one record, derived once
  per run. Holds copies; never references the source record.
*/
struct RecordFeatures {
  std::string id;
  std::string source_key;

  std::string                  manufacturer_raw;
  alias::CanonicalManufacturer manufacturer;

  std::string              part_number;  // normalized original
  std::vector<std::string> variants;     // variants[0] == part_number

  std::optional<std::string> unspsc;
  std::optional<std::string> gtin;

  std::string title;
  std::string description;

  std::vector<std::string> title_tokens;
  std::vector<std::string> description_tokens;
  similarity::TermVector   text_vector;  // title + description
};

// Title followed by description tokens; the TF-IDF document of a record.
std::vector<std::string> TextTokens(const resolver::v1::Record& record);

class FeatureExtractor {
 public:
  FeatureExtractor(const normalize::VariantGenerator& variants, const alias::AliasResolver& aliases);

  // Thread-safe; the resolver cache is the only shared mutable state.
  RecordFeatures Extract(const resolver::v1::Record& record, const similarity::TermStatistics& terms) const;

 private:
  const normalize::VariantGenerator& variants_;
  const alias::AliasResolver&        aliases_;
};

} // namespace resolver::features
