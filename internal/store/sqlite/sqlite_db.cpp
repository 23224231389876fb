#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"
#include "sqlite_common.hpp"

namespace resolver::store::sqlite {

namespace {

constexpr int kOpenFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw util::InvalidArgument("sqlite database path is empty");
  }

  if (sqlite3_open_v2(path_.c_str(), &db_, kOpenFlags, nullptr) == SQLITE_OK) {
    return;
  }

  // sqlite hands back a handle even on failure; it carries the reason
  const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
  sqlite3_close(db_);
  db_ = nullptr;
  throw util::BackendError("cannot open catalog database " + path_ + ": " + reason);
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* raw = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &raw) == SQLITE_OK) {
    return;
  }

  std::unique_ptr<char, decltype(&sqlite3_free)> message(raw, &sqlite3_free);
  throw util::BackendError(path_ + ": " + (message ? message.get() : sqlite3_errmsg(db_)));
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  const int     rc  = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);

  Statement st(raw);
  ThrowIfError(Translate(db_, rc), "prepare on " + path_);
  return st;
}

void SqliteDB::ReadRows(sqlite3_stmt* st, const RowReader& read, const std::string& what) {
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    read(st);
  }
  if (rc != SQLITE_DONE) {
    ThrowIfError(Translate(db_, rc), what);
  }
}

} // namespace resolver::store::sqlite
