#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/pipeline/resolution_engine.hpp"
#include "internal/query/golden_record_store.hpp"
#include "internal/store/api/record_source.hpp"
#include "internal/store/api/resolution_sink.hpp"
#include "internal/store/memory/memory_sink.hpp"
#include "internal/store/memory/memory_source.hpp"
#include "internal/util/errors.hpp"

#if RESOLVER_DB_SQLITE
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_schema.hpp"
#include "internal/store/sqlite/sqlite_sink.hpp"
#include "internal/store/sqlite/sqlite_source.hpp"
#endif

#if RESOLVER_DB_POSTGRES
#include "internal/store/postgres/pg_pool.hpp"
#include "internal/store/postgres/pg_schema.hpp"
#include "internal/store/postgres/pg_sink.hpp"
#include "internal/store/postgres/pg_source.hpp"
#endif

namespace {

using google::protobuf::util::MessageDifferencer;
using resolver::store::RecordSource;
using resolver::store::ResolutionSink;
using resolver::v1::GoldenRecord;
using resolver::v1::PairScore;
using resolver::v1::Record;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                                                name;
  std::function<std::shared_ptr<RecordSource>(const std::vector<Record>&)> make_source;
  std::function<std::shared_ptr<ResolutionSink>()>                          make_sink;
  std::function<bool()>                                                      supports_restart;
  std::function<void()>                                                      cleanup;
};

Record MakeRecord(const std::string& id, const std::string& manufacturer, const std::string& part_number, const std::string& title,
                  const std::string& unspsc = {}, const std::string& gtin = {}) {
  Record record;
  record.set_id(id);
  record.set_source_key("catalog-" + id.substr(0, 1));
  record.set_manufacturer_raw(manufacturer);
  record.set_part_number_raw(part_number);
  record.set_title(title);
  record.set_description(title + " (" + part_number + ")");
  record.set_unspsc(unspsc);
  record.set_gtin(gtin);
  return record;
}

std::vector<Record> Catalog() {
  return {
      MakeRecord("b2", "3M", "AGM14NV-412341 4111 ea", "Vinyl electrical tape black", "31201503", "00051131064897"),
      MakeRecord("a1", "3M Company", "14NV4123414111", "Vinyl electrical tape black", "31201503", "00051131064897"),
      MakeRecord("c1", "Eaton", "BR120", "Circuit breaker 20A", "39121601"),
      MakeRecord("a3", "Eaton Corporation", "BR-120", "Circuit breaker 20A single pole", "39121601"),
      MakeRecord("d9", "Panduit", "PLT2S-C", "Cable tie, nylon \"natural\""),
  };
}

GoldenRecord MakeGolden(const std::string& id, const std::vector<std::string>& members, const std::string& manufacturer) {
  GoldenRecord golden;
  golden.set_id(id);
  for (const auto& member : members) {
    golden.add_member_ids(member);
  }
  golden.add_source_keys("catalog-a");
  auto* rep = golden.mutable_representative();
  rep->set_manufacturer(manufacturer);
  rep->set_part_number("P-" + id);
  rep->set_title("Title of " + id);
  rep->set_unspsc("31201503");
  return golden;
}

PairScore MakePairScore(const std::string& a, const std::string& b, double score) {
  PairScore pair;
  pair.set_id_a(a);
  pair.set_id_b(b);
  pair.set_overall_score(score);
  pair.set_weighted_sum(score - 0.1);
  auto* pn = pair.mutable_comparison()->mutable_part_number();
  pn->add_variants_a("14NV4123414111");
  pn->add_variants_b("AGM14NV412341 4111 EA");
  pn->set_jaro_winkler(0.875);
  pn->set_applicable(true);
  pair.mutable_comparison()->set_gtin_mismatch(true);
  return pair;
}

template <typename T>
bool SameMessages(const std::vector<T>& a, const std::vector<T>& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!MessageDifferencer::Equals(a[i], b[i])) return false;
  }
  return true;
}

void VerifySourceReadsInIdOrder(BackendFactory& backend) {
  const auto catalog = Catalog();
  auto       source  = backend.make_source(catalog);

  std::vector<Record> seen;
  source->IterateAll([&](const Record& record) { seen.push_back(record); });
  assert(seen.size() == catalog.size());
  for (std::size_t i = 1; i < seen.size(); ++i) {
    assert(seen[i - 1].id() < seen[i].id());
  }

  auto d9 = source->Get("d9");
  assert(d9.has_value());
  assert(MessageDifferencer::Equals(*d9, catalog[4]));
  assert(!source->Get("zz").has_value());
  assert(!source->Describe().empty());
}

void VerifySinkStartsEmpty(ResolutionSink& sink) {
  assert(sink.ReadGoldenRecords().empty());
  assert(sink.ReadPairScores().empty());
}

void VerifyCommitReplacesGeneration(ResolutionSink& sink) {
  const std::vector<GoldenRecord> first = {MakeGolden("GR-0000000000000001", {"a1", "b2"}, "3M"),
                                           MakeGolden("GR-0000000000000002", {"c1"}, "EATON")};
  const std::vector<PairScore>    pairs = {MakePairScore("a1", "b2", 0.91), MakePairScore("a3", "c1", 0.72)};

  {
    auto tx = sink.Begin();
    assert(sink.WritePairScores(*tx, pairs));
    assert(sink.WriteGoldenRecords(*tx, first));
    tx->Commit();
    assert(tx->IsCommitted());

    bool threw = false;
    try {
      tx->Commit();
    } catch (const resolver::util::BackendError&) {
      threw = true;
    }
    assert(threw);
  }
  assert(SameMessages(sink.ReadGoldenRecords(), first));
  assert(SameMessages(sink.ReadPairScores(), pairs));

  // a later generation replaces everything, including records that vanished
  const std::vector<GoldenRecord> second = {MakeGolden("GR-0000000000000003", {"a1", "b2", "c1"}, "3M")};
  {
    auto tx = sink.Begin();
    assert(sink.WriteGoldenRecords(*tx, second));
    assert(sink.WritePairScores(*tx, {pairs[0]}));
    tx->Commit();
  }
  assert(SameMessages(sink.ReadGoldenRecords(), second));
  assert(SameMessages(sink.ReadPairScores(), std::vector<PairScore>{pairs[0]}));
}

void VerifyUncommittedWritesRollBack(ResolutionSink& sink) {
  const auto golden_before = sink.ReadGoldenRecords();
  const auto pairs_before  = sink.ReadPairScores();

  {
    auto tx = sink.Begin();
    assert(sink.WriteGoldenRecords(*tx, {MakeGolden("GR-00000000000000ff", {"x"}, "NOBODY")}));
    assert(sink.WritePairScores(*tx, {}));
    // destroyed without Commit
  }
  assert(SameMessages(sink.ReadGoldenRecords(), golden_before));
  assert(SameMessages(sink.ReadPairScores(), pairs_before));

  auto tx = sink.Begin();
  assert(sink.WriteGoldenRecords(*tx, {}));
  tx->Rollback();
  assert(!tx->IsCommitted());
  assert(SameMessages(sink.ReadGoldenRecords(), golden_before));

  // a finished transaction cannot be committed, rolling back again is harmless
  tx->Rollback();
  bool threw = false;
  try {
    tx->Commit();
  } catch (const resolver::util::BackendError&) {
    threw = true;
  }
  assert(threw);
  assert(!tx->IsCommitted());
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) return;

  const std::vector<GoldenRecord> golden = {MakeGolden("GR-00000000000000aa", {"a1"}, "3M")};
  {
    auto sink = backend.make_sink();
    auto tx   = sink->Begin();
    assert(sink->WriteGoldenRecords(*tx, golden));
    assert(sink->WritePairScores(*tx, {MakePairScore("a1", "b2", 0.5)}));
    tx->Commit();
  }

  auto reopened = backend.make_sink();
  assert(SameMessages(reopened->ReadGoldenRecords(), golden));
  assert(reopened->ReadPairScores().size() == 1);
  assert(reopened->ReadPairScores()[0].comparison().part_number().jaro_winkler() == 0.875);
}

// The engine produces the same golden records whatever the backend pair.
void VerifyEngineParity(BackendFactory& backend, const std::vector<GoldenRecord>& reference) {
  resolver::config::EngineOptions options;
  options.threads = 2;

  auto                                 sink  = backend.make_sink();
  auto                                 store = std::make_shared<resolver::query::GoldenRecordStore>();
  resolver::pipeline::ResolutionEngine engine(options, backend.make_source(Catalog()), sink, store);

  const auto report = engine.Run();
  assert(report.golden_records == 3);
  assert(SameMessages(sink->ReadGoldenRecords(), reference));
  assert(SameMessages(store->Current()->golden_records, reference));

  const auto recluster = engine.Recluster();
  assert(recluster.scored_pairs == report.scored_pairs);
  assert(SameMessages(sink->ReadGoldenRecords(), reference));
}

std::vector<GoldenRecord> ReferenceGoldenRecords() {
  auto                                 sink  = std::make_shared<resolver::store::memory::MemoryResolutionSink>();
  auto                                 store = std::make_shared<resolver::query::GoldenRecordStore>();
  resolver::pipeline::ResolutionEngine engine(resolver::config::EngineOptions{},
                                              std::make_shared<resolver::store::memory::MemoryRecordSource>(Catalog()), sink, store);
  engine.Run();
  return sink->ReadGoldenRecords();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_source      = [](const std::vector<Record>& records) { return std::make_shared<resolver::store::memory::MemoryRecordSource>(records); },
      .make_sink        = []() { return std::make_shared<resolver::store::memory::MemoryResolutionSink>(); },
      .supports_restart = []() { return false; },
      .cleanup          = []() {},
  };
}

#if RESOLVER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto base      = std::filesystem::temp_directory_path() / ("resolver_parity_sqlite_" + std::to_string(NowMs()));
  const auto sink_path = base.string() + "_sink.db";
  auto       counter   = std::make_shared<int>(0);

  auto open = [](const std::string& path) { return resolver::store::sqlite::OpenResolverDatabase(path); };

  return BackendFactory{
      .name = "sqlite",
      .make_source =
          [base, counter, open](const std::vector<Record>& records) {
            // one file per source so each starts from exactly `records`
            auto source = std::make_shared<resolver::store::sqlite::SqliteRecordSource>(
                open(base.string() + "_source_" + std::to_string((*counter)++) + ".db"));
            for (const auto& record : records) {
              const auto result = source->Upsert(record);
              assert(result);
            }
            return source;
          },
      .make_sink        = [sink_path, open]() { return std::make_shared<resolver::store::sqlite::SqliteResolutionSink>(open(sink_path)); },
      .supports_restart = []() { return true; },
      .cleanup =
          [base, sink_path, counter]() {
            for (const char* suffix : {"", "-wal", "-shm"}) {
              std::filesystem::remove(sink_path + suffix);
              for (int i = 0; i < *counter; ++i) {
                std::filesystem::remove(base.string() + "_source_" + std::to_string(i) + ".db" + suffix);
              }
            }
          },
  };
}
#endif

#if RESOLVER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("RESOLVER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("RESOLVER_TEST_POSTGRES_URI is not set");
  }

  auto pool = std::make_shared<resolver::store::postgres::PgPool>(std::string(uri));
  resolver::store::postgres::BootstrapPostgresSchema(pool);

  auto truncate = [pool](const char* tables) {
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    tx.exec(std::string("TRUNCATE ") + tables + ";");
    tx.commit();
  };
  truncate("records, golden_records, golden_record_members, pair_scores");

  return BackendFactory{
      .name = "postgres",
      .make_source =
          [pool, truncate](const std::vector<Record>& records) {
            truncate("records");
            auto source = std::make_shared<resolver::store::postgres::PgRecordSource>(pool);
            for (const auto& record : records) {
              const auto result = source->Upsert(record);
              assert(result);
            }
            return source;
          },
      .make_sink        = [pool]() { return std::make_shared<resolver::store::postgres::PgResolutionSink>(pool); },
      .supports_restart = []() { return true; },
      .cleanup          = [truncate]() { truncate("records, golden_records, golden_record_members, pair_scores"); },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend, const std::vector<GoldenRecord>& reference) {
  std::cout << "running backend suite: " << backend.name << "\n";

  VerifySourceReadsInIdOrder(backend);

  auto sink = backend.make_sink();
  VerifySinkStartsEmpty(*sink);
  VerifyCommitReplacesGeneration(*sink);
  VerifyUncommittedWritesRollBack(*sink);
  VerifyRestartDurability(backend);
  VerifyEngineParity(backend, reference);

  backend.cleanup();
}

} // namespace

int main() {
  const auto reference = ReferenceGoldenRecords();
  assert(reference.size() == 3);

  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if RESOLVER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if RESOLVER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres backend suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend, reference);
  }

  std::cout << "backend_parity_test: pass\n";
  return 0;
}
