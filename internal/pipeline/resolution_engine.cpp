#include "resolution_engine.hpp"

#include <set>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/query/generation.hpp"
#include "internal/similarity/term_statistics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace resolver::pipeline {

using observability::IntField;
using observability::StringField;

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Since(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::int64_t Count(std::size_t n) {
  return static_cast<std::int64_t>(n);
}

} // namespace

ResolutionEngine::ResolutionEngine(config::EngineOptions                    options,
                                   std::shared_ptr<store::RecordSource>     source,
                                   std::shared_ptr<store::ResolutionSink>   sink,
                                   std::shared_ptr<query::GoldenRecordStore> golden_store)
    : options_(std::move(options)),
      source_(std::move(source)),
      sink_(std::move(sink)),
      golden_store_(std::move(golden_store)),
      variants_(options_.max_variants),
      aliases_(std::make_shared<alias::AliasResolver>(options_.BuildAliasTable(), options_.alias_resolver)),
      blocker_(options_.blocking),
      scorer_(options_.scoring),
      clusterer_(options_.clustering),
      pool_(options_.threads) {
  options_.Validate();
  if (!source_ || !sink_ || !golden_store_) {
    throw util::InvalidArgument("resolution engine requires a source, a sink and a golden record store");
  }
}

ResolutionEngine::~ResolutionEngine() {
  pool_.Stop();
}

// ------------------------------------------------------------------
// Phases
// ------------------------------------------------------------------

ResolutionEngine::Corpus ResolutionEngine::LoadCorpus() {
  Corpus corpus;

  std::set<std::string> seen;
  source_->IterateAll([&](const resolver::v1::Record& record) {
    util::ValidateId(record.id(), "record id");
    if (!seen.insert(record.id()).second) {
      throw util::InvalidArgument("duplicate record id in source: " + record.id());
    }
    corpus.records.push_back(record);
  });

  // IDF needs every document before any vector is built.
  for (const auto& record : corpus.records) {
    corpus.terms.AddDocument(features::TextTokens(record));
  }

  features::FeatureExtractor extractor(variants_, *aliases_);
  corpus.features.resize(corpus.records.size());
  pool_.ParallelFor(corpus.records.size(), [&](std::size_t i) {
    corpus.features[i] = extractor.Extract(corpus.records[i], corpus.terms);
  });

  return corpus;
}

std::vector<resolver::v1::PairScore> ResolutionEngine::ScoreBuckets(const blocking::BlockingResult& blocked, const std::vector<features::RecordFeatures>& features) {
  // One slot per bucket; each worker appends only to its own slot.
  std::vector<std::vector<resolver::v1::PairScore>> per_bucket(blocked.buckets.size());

  pool_.ParallelFor(blocked.buckets.size(), [&](std::size_t b) {
    const auto& bucket = blocked.buckets[b];
    auto&       out    = per_bucket[b];
    out.reserve(bucket.pairs.size());
    for (const auto& pair : bucket.pairs) {
      out.push_back(scorer_.Score(features[pair.a], features[pair.b]));
    }
  });

  std::vector<resolver::v1::PairScore> scores;
  scores.reserve(blocked.report.candidate_pairs);
  for (auto& bucket_scores : per_bucket) {
    for (auto& score : bucket_scores) {
      scores.push_back(std::move(score));
    }
  }
  return scores;
}

void ResolutionEngine::Persist(const std::vector<resolver::v1::GoldenRecord>& golden_records, const std::vector<resolver::v1::PairScore>* pair_scores) {
  auto tx = sink_->Begin();
  if (pair_scores) {
    store::ThrowIfError(sink_->WritePairScores(*tx, *pair_scores), "write pair scores to " + sink_->Describe());
  }
  store::ThrowIfError(sink_->WriteGoldenRecords(*tx, golden_records), "write golden records to " + sink_->Describe());
  tx->Commit();
}

// ------------------------------------------------------------------
// Entry points
// ------------------------------------------------------------------

RunReport ResolutionEngine::Run() {
  std::lock_guard lock(run_mutex_);
  const auto      start = Clock::now();

  RunReport report;
  report.generation = golden_store_->CurrentNumber() + 1;
  RESOLVER_LOG_INFO("Resolution run started", {IntField("generation", static_cast<std::int64_t>(report.generation)),
                                               StringField("source", source_->Describe()),
                                               StringField("sink", sink_->Describe()),
                                               IntField("threads", Count(pool_.threads()))});

  auto phase  = Clock::now();
  auto corpus = LoadCorpus();
  report.read_time = Since(phase);
  report.records   = corpus.records.size();

  phase        = Clock::now();
  auto blocked = blocker_.Block(corpus.features);
  auto scores  = ScoreBuckets(blocked, corpus.features);
  report.scoring_time = Since(phase);
  report.blocking     = blocked.report;
  report.scored_pairs = scores.size();

  phase          = Clock::now();
  auto clustered = clusterer_.Cluster(corpus.features, scores);
  report.clustering_time       = Since(phase);
  report.golden_records        = clustered.golden_records.size();
  report.singletons            = clustered.singletons;
  report.edges_above_threshold = clustered.edges_above_threshold;

  phase = Clock::now();
  Persist(clustered.golden_records, &scores);
  report.write_time = Since(phase);

  query::GenerationInput input;
  input.number                = report.generation;
  input.records               = std::move(corpus.records);
  input.features              = std::move(corpus.features);
  input.terms                 = std::move(corpus.terms);
  input.golden_records        = std::move(clustered.golden_records);
  input.pair_scores           = std::move(scores);
  input.edges_above_threshold = clustered.edges_above_threshold;
  input.degraded              = blocked.report.degraded;
  golden_store_->Publish(query::BuildGeneration(std::move(input)));

  report.total_time = Since(start);
  RESOLVER_LOG_INFO("Resolution run finished", {IntField("generation", static_cast<std::int64_t>(report.generation)),
                                                IntField("records", Count(report.records)),
                                                IntField("candidate_pairs", Count(report.blocking.candidate_pairs)),
                                                IntField("degraded_buckets", Count(report.blocking.degraded.size())),
                                                IntField("edges", Count(report.edges_above_threshold)),
                                                IntField("golden_records", Count(report.golden_records)),
                                                IntField("singletons", Count(report.singletons)),
                                                IntField("duration_ms", report.total_time.count())});
  return report;
}

RunReport ResolutionEngine::Recluster() {
  std::lock_guard lock(run_mutex_);
  const auto      start = Clock::now();

  RunReport report;
  report.generation = golden_store_->CurrentNumber() + 1;
  RESOLVER_LOG_INFO("Recluster started", {IntField("generation", static_cast<std::int64_t>(report.generation)), StringField("sink", sink_->Describe())});

  auto phase  = Clock::now();
  auto corpus = LoadCorpus();
  auto scores = sink_->ReadPairScores();
  report.read_time    = Since(phase);
  report.records      = corpus.records.size();
  report.scored_pairs = scores.size();

  phase          = Clock::now();
  auto clustered = clusterer_.Cluster(corpus.features, scores);
  report.clustering_time       = Since(phase);
  report.golden_records        = clustered.golden_records.size();
  report.singletons            = clustered.singletons;
  report.edges_above_threshold = clustered.edges_above_threshold;
  if (clustered.unknown_edges > 0) {
    RESOLVER_LOG_WARN("Persisted pair scores name records missing from the source", {IntField("edges", Count(clustered.unknown_edges))});
  }

  phase = Clock::now();
  Persist(clustered.golden_records, nullptr);
  report.write_time = Since(phase);

  query::GenerationInput input;
  input.number                = report.generation;
  input.records               = std::move(corpus.records);
  input.features              = std::move(corpus.features);
  input.terms                 = std::move(corpus.terms);
  input.golden_records        = std::move(clustered.golden_records);
  input.pair_scores           = std::move(scores);
  input.edges_above_threshold = clustered.edges_above_threshold;
  golden_store_->Publish(query::BuildGeneration(std::move(input)));

  report.total_time = Since(start);
  RESOLVER_LOG_INFO("Recluster finished", {IntField("generation", static_cast<std::int64_t>(report.generation)),
                                           IntField("golden_records", Count(report.golden_records)),
                                           IntField("duration_ms", report.total_time.count())});
  return report;
}

RunReport ResolutionEngine::Hydrate() {
  std::lock_guard lock(run_mutex_);
  const auto      start = Clock::now();

  RunReport report;
  report.generation = golden_store_->CurrentNumber() + 1;

  auto corpus = LoadCorpus();
  auto golden = sink_->ReadGoldenRecords();
  auto scores = sink_->ReadPairScores();
  report.read_time = Since(start);

  const double threshold = options_.clustering.threshold;
  for (const auto& score : scores) {
    if (score.overall_score() >= threshold) ++report.edges_above_threshold;
  }
  for (const auto& record : golden) {
    if (record.member_ids_size() == 1) ++report.singletons;
  }
  report.records        = corpus.records.size();
  report.golden_records = golden.size();
  report.scored_pairs   = scores.size();

  query::GenerationInput input;
  input.number                = report.generation;
  input.records               = std::move(corpus.records);
  input.features              = std::move(corpus.features);
  input.terms                 = std::move(corpus.terms);
  input.golden_records        = std::move(golden);
  input.pair_scores           = std::move(scores);
  input.edges_above_threshold = report.edges_above_threshold;
  golden_store_->Publish(query::BuildGeneration(std::move(input)));

  report.total_time = Since(start);
  RESOLVER_LOG_INFO("Hydrated from sink", {StringField("sink", sink_->Describe()),
                                           IntField("golden_records", Count(report.golden_records)),
                                           IntField("pair_scores", Count(report.scored_pairs))});
  return report;
}

} // namespace resolver::pipeline
