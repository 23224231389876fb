#include "sqlite_source.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "sqlite_common.hpp"

namespace resolver::store::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id,source_key,manufacturer,part_number,title,description,unspsc,gtin FROM records";

resolver::v1::Record ReadRow(sqlite3_stmt* st) {
  resolver::v1::Record r;
  r.set_id(ColText(st, 0));
  r.set_source_key(ColText(st, 1));
  r.set_manufacturer_raw(ColText(st, 2));
  r.set_part_number_raw(ColText(st, 3));
  r.set_title(ColText(st, 4));
  r.set_description(ColText(st, 5));
  r.set_unspsc(ColText(st, 6));
  r.set_gtin(ColText(st, 7));
  return r;
}

} // namespace

SqliteRecordSource::SqliteRecordSource(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::string SqliteRecordSource::Describe() const {
  return "sqlite:" + db_->Path();
}

Result SqliteRecordSource::Upsert(const resolver::v1::Record& r) {
  util::ValidateId(r.id(), "record id");

  auto* db = db_->Handle();
  auto  st = db_->Prepare(
      "INSERT INTO records(id,source_key,manufacturer,part_number,title,description,unspsc,gtin) VALUES(?,?,?,?,?,?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET source_key=excluded.source_key,manufacturer=excluded.manufacturer,"
      "part_number=excluded.part_number,title=excluded.title,description=excluded.description,"
      "unspsc=excluded.unspsc,gtin=excluded.gtin;");

  BindText(st.get(), 1, r.id());
  BindText(st.get(), 2, r.source_key());
  BindText(st.get(), 3, r.manufacturer_raw());
  BindText(st.get(), 4, r.part_number_raw());
  BindText(st.get(), 5, r.title());
  BindText(st.get(), 6, r.description());
  BindText(st.get(), 7, r.unspsc());
  BindText(st.get(), 8, r.gtin());

  return Translate(db, sqlite3_step(st.get()));
}

void SqliteRecordSource::IterateAll(const RecordVisitor& visit) {
  auto st = db_->Prepare(std::string(kSelectColumns) + " ORDER BY id;");
  db_->ReadRows(st.get(), [&visit](sqlite3_stmt* row) { visit(ReadRow(row)); }, "sqlite read records");
}

std::optional<resolver::v1::Record> SqliteRecordSource::Get(const std::string& id) {
  auto* db = db_->Handle();
  auto  st = db_->Prepare(std::string(kSelectColumns) + " WHERE id=?;");
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    ThrowIfError(Translate(db, rc), "sqlite read record " + id);
  }
  return ReadRow(st.get());
}

} // namespace resolver::store::sqlite
