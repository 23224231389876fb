#include "sqlite_schema.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resolver::store::sqlite {

namespace {

// A resolution run holds the write lock for the whole generation swap.
constexpr int kBusyTimeoutMs = 5000;

const std::vector<std::string> kTables = {
    "CREATE TABLE IF NOT EXISTS records (id TEXT PRIMARY KEY, source_key TEXT NOT NULL DEFAULT '', manufacturer TEXT NOT NULL DEFAULT '', part_number TEXT NOT NULL DEFAULT '', title TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', unspsc TEXT NOT NULL DEFAULT '', gtin TEXT NOT NULL DEFAULT '');",
    "CREATE TABLE IF NOT EXISTS golden_records (id TEXT PRIMARY KEY, manufacturer TEXT NOT NULL, part_number TEXT NOT NULL, unspsc TEXT NOT NULL, member_count INTEGER NOT NULL, payload BLOB NOT NULL);",
    "CREATE TABLE IF NOT EXISTS golden_record_members (record_id TEXT PRIMARY KEY, golden_record_id TEXT NOT NULL, FOREIGN KEY(golden_record_id) REFERENCES golden_records(id) ON DELETE CASCADE);",
    "CREATE INDEX IF NOT EXISTS golden_record_members_by_golden ON golden_record_members(golden_record_id);",
    "CREATE TABLE IF NOT EXISTS pair_scores (id_a TEXT NOT NULL, id_b TEXT NOT NULL, overall_score REAL NOT NULL, payload BLOB NOT NULL, PRIMARY KEY (id_a, id_b));",
};

const std::vector<std::string> kColumnChecks = {
    "SELECT id,source_key,manufacturer,part_number,title,description,unspsc,gtin FROM records LIMIT 0;",
    "SELECT id,manufacturer,part_number,unspsc,member_count,payload FROM golden_records LIMIT 0;",
    "SELECT record_id,golden_record_id FROM golden_record_members LIMIT 0;",
    "SELECT id_a,id_b,overall_score,payload FROM pair_scores LIMIT 0;",
};

void ApplyConnectionSettings(SqliteDB& db) {
  // members are dropped through ON DELETE CASCADE from golden_records
  db.Exec("PRAGMA foreign_keys=ON;");
  if (!db.InMemory()) {
    db.Exec("PRAGMA journal_mode=WAL;");
    db.Exec("PRAGMA synchronous=NORMAL;");
  }
  if (sqlite3_busy_timeout(db.Handle(), kBusyTimeoutMs) != SQLITE_OK) {
    throw util::BackendError("cannot set busy timeout on " + db.Path());
  }
}

} // namespace

void BootstrapSqliteSchema(SqliteDB& db) {
  for (const auto& sql : kTables) db.Exec(sql);
  for (const auto& sql : kColumnChecks) db.Prepare(sql);

  RESOLVER_LOG_INFO("SQLite schema ready", {observability::StringField("path", db.Path())});
}

std::shared_ptr<SqliteDB> OpenResolverDatabase(const std::string& path) {
  auto db = std::make_shared<SqliteDB>(path);
  ApplyConnectionSettings(*db);
  BootstrapSqliteSchema(*db);
  return db;
}

} // namespace resolver::store::sqlite
