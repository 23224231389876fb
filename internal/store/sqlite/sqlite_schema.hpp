#pragma once

#include <memory>
#include <string>

#include "sqlite_db.hpp"

namespace resolver::store::sqlite {

// Opens (creating when missing) a catalog database at `path`: foreign keys
// on for the member cascade, WAL for file databases, then the records,
// golden record and pair score tables. ":memory:" gives a private database.
std::shared_ptr<SqliteDB> OpenResolverDatabase(const std::string& path);

// Creates missing tables and checks every column the backend reads.
void BootstrapSqliteSchema(SqliteDB& db);

} // namespace resolver::store::sqlite
