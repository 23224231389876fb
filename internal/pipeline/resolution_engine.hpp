#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/alias/alias_resolver.hpp"
#include "internal/blocking/blocker.hpp"
#include "internal/clustering/clusterer.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/features/record_features.hpp"
#include "internal/normalize/variant_generator.hpp"
#include "internal/pipeline/worker_pool.hpp"
#include "internal/query/golden_record_store.hpp"
#include "internal/scoring/pair_scorer.hpp"
#include "internal/similarity/term_statistics.hpp"
#include "internal/store/api/record_source.hpp"
#include "internal/store/api/resolution_sink.hpp"

namespace resolver::pipeline {

struct RunReport {
  std::uint64_t generation            = 0;
  std::size_t   records               = 0;
  std::size_t   golden_records        = 0;
  std::size_t   singletons            = 0;
  std::size_t   scored_pairs          = 0;
  std::size_t   edges_above_threshold = 0;

  blocking::BlockingReport blocking;

  std::chrono::milliseconds read_time{0};
  std::chrono::milliseconds scoring_time{0};
  std::chrono::milliseconds clustering_time{0};
  std::chrono::milliseconds write_time{0};
  std::chrono::milliseconds total_time{0};
};

/*
  ResolutionEngine

  Run():
    read source -> features (parallel) -> block -> score buckets (parallel)
    -> barrier -> cluster -> one sink transaction -> publish

  Recluster(): same, but the edges come from the sink's persisted pair
  scores instead of rescoring.

  Hydrate(): publishes the sink's last committed golden records and pair
  scores as they are; nothing is written.

  Any exception leaves the sink and the published generation untouched.
  Runs are serialized; queries against the store never wait for a run.
*/
class ResolutionEngine {
 public:
  ResolutionEngine(config::EngineOptions                   options,
                   std::shared_ptr<store::RecordSource>    source,
                   std::shared_ptr<store::ResolutionSink>  sink,
                   std::shared_ptr<query::GoldenRecordStore> golden_store);
  ~ResolutionEngine();

  RunReport Run();
  RunReport Recluster();
  RunReport Hydrate();

  std::shared_ptr<const alias::AliasResolver> aliases() const {
    return aliases_;
  }

  const scoring::PairScorer& scorer() const {
    return scorer_;
  }

  const normalize::VariantGenerator& variants() const {
    return variants_;
  }

 private:
  struct Corpus {
    std::vector<resolver::v1::Record>     records;
    std::vector<features::RecordFeatures> features;
    similarity::TermStatistics            terms;
  };

  Corpus LoadCorpus();

  std::vector<resolver::v1::PairScore> ScoreBuckets(const blocking::BlockingResult& blocked, const std::vector<features::RecordFeatures>& features);

  void Persist(const std::vector<resolver::v1::GoldenRecord>& golden_records, const std::vector<resolver::v1::PairScore>* pair_scores);

  config::EngineOptions                   options_;
  std::shared_ptr<store::RecordSource>    source_;
  std::shared_ptr<store::ResolutionSink>  sink_;
  std::shared_ptr<query::GoldenRecordStore> golden_store_;

  normalize::VariantGenerator             variants_;
  std::shared_ptr<alias::AliasResolver>   aliases_;
  blocking::Blocker                       blocker_;
  scoring::PairScorer                     scorer_;
  clustering::Clusterer                   clusterer_;
  WorkerPool                              pool_;

  std::mutex run_mutex_;
};

} // namespace resolver::pipeline
