#include "pg_schema.hpp"

#include "internal/observability/logging.hpp"

namespace resolver::store::postgres {

void BootstrapPostgresSchema(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS records (id TEXT PRIMARY KEY, source_key TEXT NOT NULL DEFAULT '', manufacturer TEXT NOT NULL DEFAULT '', part_number TEXT NOT NULL DEFAULT '', title TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', unspsc TEXT NOT NULL DEFAULT '', gtin TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE TABLE IF NOT EXISTS golden_records (id TEXT PRIMARY KEY, manufacturer TEXT NOT NULL, part_number TEXT NOT NULL, unspsc TEXT NOT NULL, member_count INTEGER NOT NULL, payload JSONB NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS golden_record_members (record_id TEXT PRIMARY KEY, golden_record_id TEXT NOT NULL REFERENCES golden_records(id) ON DELETE CASCADE);");
  tx.exec("CREATE INDEX IF NOT EXISTS golden_record_members_by_golden ON golden_record_members(golden_record_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS pair_scores (id_a TEXT NOT NULL, id_b TEXT NOT NULL, overall_score DOUBLE PRECISION NOT NULL, payload JSONB NOT NULL, PRIMARY KEY (id_a, id_b));");

  tx.exec("SELECT id,source_key,manufacturer,part_number,title,description,unspsc,gtin FROM records LIMIT 1;");
  tx.exec("SELECT id,manufacturer,part_number,unspsc,member_count,payload FROM golden_records LIMIT 1;");
  tx.exec("SELECT record_id,golden_record_id FROM golden_record_members LIMIT 1;");
  tx.exec("SELECT id_a,id_b,overall_score,payload FROM pair_scores LIMIT 1;");
  tx.commit();

  RESOLVER_LOG_INFO("Postgres schema ready");
}

} // namespace resolver::store::postgres
