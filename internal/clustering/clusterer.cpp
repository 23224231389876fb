#include "clusterer.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <unordered_map>

#include "internal/clustering/disjoint_set.hpp"
#include "internal/util/hash.hpp"

namespace resolver::clustering {
namespace {

constexpr char kIdSeparator = '\x1F';

// Counts values in member order; the earliest first-seen value wins ties.
class ModeCounter {
 public:
  void Add(const std::string& value) {
    if (value.empty()) return;
    auto [it, inserted] = counts_.try_emplace(value, 0);
    if (inserted) order_.push_back(value);
    ++it->second;
  }

  std::string Mode() const {
    std::string best;
    std::size_t best_count = 0;
    for (const auto& value : order_) {
      const auto count = counts_.at(value);
      if (count > best_count) {
        best       = value;
        best_count = count;
      }
    }
    return best;
  }

 private:
  std::unordered_map<std::string, std::size_t> counts_;
  std::vector<std::string>                     order_;
};

// Longest non-empty value; members arrive in id order so the first one wins ties.
void KeepLongest(std::string& current, const std::string& candidate) {
  if (candidate.size() > current.size()) current = candidate;
}

resolver::v1::GoldenRecord BuildGoldenRecord(const std::vector<features::RecordFeatures>& records,
                                             std::vector<std::size_t> members) {
  std::sort(members.begin(), members.end(), [&](std::size_t l, std::size_t r) { return records[l].id < records[r].id; });

  resolver::v1::GoldenRecord golden;
  std::vector<std::string>   member_ids;
  member_ids.reserve(members.size());

  std::string title;
  std::string description;
  ModeCounter manufacturer;
  ModeCounter part_number;
  ModeCounter unspsc;
  ModeCounter gtin;
  std::vector<std::string> source_keys;

  for (auto index : members) {
    const auto& record = records[index];
    member_ids.push_back(record.id);
    golden.add_member_ids(record.id);

    KeepLongest(title, record.title);
    KeepLongest(description, record.description);
    manufacturer.Add(record.manufacturer.identity);
    part_number.Add(record.part_number);
    unspsc.Add(record.unspsc.value_or(""));
    gtin.Add(record.gtin.value_or(""));
    if (!record.source_key.empty()) source_keys.push_back(record.source_key);
  }

  std::sort(source_keys.begin(), source_keys.end());
  source_keys.erase(std::unique(source_keys.begin(), source_keys.end()), source_keys.end());
  for (const auto& key : source_keys) golden.add_source_keys(key);

  auto* representative = golden.mutable_representative();
  representative->set_title(title);
  representative->set_description(description);
  representative->set_manufacturer(manufacturer.Mode());
  representative->set_part_number(part_number.Mode());
  representative->set_unspsc(unspsc.Mode());
  representative->set_gtin(gtin.Mode());

  golden.set_id(GoldenRecordId(std::move(member_ids)));
  return golden;
}

} // namespace

std::string GoldenRecordId(std::vector<std::string> member_ids) {
  std::sort(member_ids.begin(), member_ids.end());

  std::uint64_t hash = util::kFnvOffsetBasis;
  for (std::size_t i = 0; i < member_ids.size(); ++i) {
    if (i > 0) hash = util::Fnv1a64(std::string_view(&kIdSeparator, 1), hash);
    hash = util::Fnv1a64(member_ids[i], hash);
  }
  return "GR-" + util::ToHex64(hash);
}

Clusterer::Clusterer(ClusteringOptions options) : options_(options) {
}

ClusteringResult Clusterer::Cluster(const std::vector<features::RecordFeatures>& records,
                                    const std::vector<resolver::v1::PairScore>& scores) const {
  ClusteringResult result;

  std::unordered_map<std::string, std::size_t> index_of;
  index_of.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) index_of.emplace(records[i].id, i);

  DisjointSet components(records.size());
  for (const auto& score : scores) {
    if (score.overall_score() < options_.threshold) continue;

    auto a = index_of.find(score.id_a());
    auto b = index_of.find(score.id_b());
    if (a == index_of.end() || b == index_of.end()) {
      ++result.unknown_edges;
      continue;
    }
    ++result.edges_above_threshold;
    components.Union(a->second, b->second);
  }

  std::map<std::size_t, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < records.size(); ++i) groups[components.Find(i)].push_back(i);

  result.golden_records.reserve(groups.size());
  for (auto& [root, members] : groups) {
    if (members.size() == 1) ++result.singletons;
    result.golden_records.push_back(BuildGoldenRecord(records, std::move(members)));
  }

  std::sort(result.golden_records.begin(), result.golden_records.end(),
            [](const auto& l, const auto& r) { return l.id() < r.id(); });
  return result;
}

} // namespace resolver::clustering
