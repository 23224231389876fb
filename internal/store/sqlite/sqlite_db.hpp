#pragma once

#include <sqlite3.h>

#include <functional>
#include <memory>
#include <string>

namespace resolver::store::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;
using RowReader = std::function<void(sqlite3_stmt*)>;

/*
  One open catalog database file.

  The source and the sink each hold their own SqliteDB so an open
  resolution transaction never shows its half-written generation to
  record reads. Use OpenResolverDatabase() to get one with the tables
  and connection settings in place.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool InMemory() const {
    return path_ == ":memory:";
  }

  void      Exec(const std::string& sql);
  Statement Prepare(const std::string& sql);

  // Steps `st` until SQLITE_DONE, handing each row to `read`.
  void ReadRows(sqlite3_stmt* st, const RowReader& read, const std::string& what);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace resolver::store::sqlite
