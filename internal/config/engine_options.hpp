#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/alias/alias_resolver.hpp"
#include "internal/alias/alias_table.hpp"
#include "internal/blocking/blocker.hpp"
#include "internal/clustering/clusterer.hpp"
#include "internal/normalize/variant_generator.hpp"
#include "internal/scoring/pair_scorer.hpp"

namespace resolver::config {

/*
  Resolved engine settings.

  Proto3 optional fields left unset take the defaults of the component they
  configure. Out-of-range values throw util::InvalidArgument.
*/
struct EngineOptions {
  std::size_t max_variants = normalize::kDefaultMaxVariants;

  std::string                    alias_path;  // empty = no alias file
  std::vector<alias::AliasEntry> alias_entries;
  alias::AliasTableOptions       alias_table;
  alias::AliasResolverOptions    alias_resolver;

  blocking::BlockingOptions     blocking;
  scoring::ScoringOptions       scoring;
  clustering::ClusteringOptions clustering;

  std::size_t threads = 0;  // 0 = hardware concurrency

  // Relative alias paths are resolved against base_dir (the config file's directory).
  static EngineOptions FromConfig(const resolver::runtime::config::RuntimeConfig& config, const std::string& base_dir = {});

  void Validate() const;

  // Loads alias_path (if any) then adds the inline entries.
  alias::AliasTable BuildAliasTable() const;
};

} // namespace resolver::config
