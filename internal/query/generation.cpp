#include "generation.hpp"

#include <algorithm>

namespace resolver::query {

PairKey MakePairKey(const std::string& a, const std::string& b) {
  return a < b ? PairKey{a, b} : PairKey{b, a};
}

namespace {

resolver::v1::BucketDegradation ToProto(const blocking::BucketDegradation& degradation) {
  resolver::v1::BucketDegradation out;
  out.set_bucket_key(degradation.key);
  out.set_size(degradation.size);
  out.set_policy(std::string(blocking::PolicyName(degradation.policy)));
  out.set_pairs_kept(degradation.pairs_kept);
  out.set_pairs_total(degradation.pairs_total);
  return out;
}

} // namespace

std::shared_ptr<const Generation> BuildGeneration(GenerationInput input) {
  auto generation    = std::make_shared<Generation>();
  generation->number = input.number;
  generation->terms  = std::move(input.terms);

  for (auto& record : input.records) {
    auto id = record.id();
    generation->records.emplace(std::move(id), std::move(record));
  }
  for (auto& features : input.features) {
    auto id = features.id;
    generation->features.emplace(std::move(id), std::move(features));
  }

  std::sort(input.golden_records.begin(), input.golden_records.end(), [](const auto& a, const auto& b) {
    return a.id() < b.id();
  });
  generation->golden_records = std::move(input.golden_records);

  auto& stats = generation->stats;
  for (std::size_t i = 0; i < generation->golden_records.size(); ++i) {
    const auto& golden = generation->golden_records[i];
    generation->golden_index.emplace(golden.id(), i);
    for (const auto& member : golden.member_ids()) {
      generation->record_to_golden.emplace(member, golden.id());
    }

    const auto size = static_cast<std::uint64_t>(golden.member_ids_size());
    if (size == 1) {
      stats.set_singleton_records(stats.singleton_records() + 1);
    } else {
      stats.set_multi_member_clusters(stats.multi_member_clusters() + 1);
    }
    if (golden.source_keys_size() > 1) {
      stats.set_multi_source_clusters(stats.multi_source_clusters() + 1);
    }
    stats.set_largest_cluster_size(std::max<std::uint64_t>(stats.largest_cluster_size(), size));
  }

  for (auto& score : input.pair_scores) {
    auto key = MakePairKey(score.id_a(), score.id_b());
    generation->pair_scores.emplace(std::move(key), std::move(score));
  }

  stats.set_total_records(generation->records.size());
  stats.set_total_golden_records(generation->golden_records.size());
  stats.set_scored_pairs(generation->pair_scores.size());
  stats.set_edges_above_threshold(input.edges_above_threshold);
  stats.set_generation(generation->number);
  for (const auto& degradation : input.degraded) {
    *stats.add_degraded_buckets() = ToProto(degradation);
  }

  return generation;
}

} // namespace resolver::query
