#include "factory.hpp"

#include <filesystem>
#include <stdexcept>

#include "internal/config/engine_options.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_sink.hpp"
#include "internal/store/memory/memory_source.hpp"
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
#if RESOLVER_SOURCE_ARROW
#include "internal/store/csv/arrow_csv_source.hpp"
#endif

namespace resolver::factory {

using resolver::runtime::config::SinkConfig;
using resolver::runtime::config::SourceConfig;

namespace {

[[maybe_unused]] std::string ResolvePath(const std::string& path, const std::string& base_dir) {
  if (path.empty()) {
    throw std::runtime_error("backend path is required");
  }
  std::filesystem::path resolved(path);
  if (resolved.is_relative() && !base_dir.empty() && path != ":memory:") {
    resolved = std::filesystem::path(base_dir) / resolved;
  }
  return resolved.string();
}

#if RESOLVER_DB_SQLITE
std::shared_ptr<store::sqlite::SqliteDB> OpenSqlite(const std::string& path) {
  return store::sqlite::OpenResolverDatabase(path);
}
#endif

#if RESOLVER_DB_POSTGRES
std::shared_ptr<store::postgres::PgPool> OpenPostgres(const resolver::runtime::config::PostgresBackend& config) {
  const std::size_t max_connections = config.max_connections() == 0 ? 8 : config.max_connections();
  auto              pool            = std::make_shared<store::postgres::PgPool>(config.connection_uri(), max_connections);
  store::postgres::BootstrapPostgresSchema(pool);
  return pool;
}
#endif

} // namespace

std::shared_ptr<store::RecordSource> BuildSource(const SourceConfig& config, const std::string& base_dir) {
  switch (config.backend_case()) {
    case SourceConfig::kSqlite:
#if RESOLVER_DB_SQLITE
      return std::make_shared<store::sqlite::SqliteRecordSource>(OpenSqlite(ResolvePath(config.sqlite().path(), base_dir)));
#else
      throw std::runtime_error("sqlite source requested but not enabled at build time");
#endif

    case SourceConfig::kPostgres:
#if RESOLVER_DB_POSTGRES
      return std::make_shared<store::postgres::PgRecordSource>(OpenPostgres(config.postgres()));
#else
      throw std::runtime_error("postgres source requested but not enabled at build time");
#endif

    case SourceConfig::kCsv:
#if RESOLVER_SOURCE_ARROW
      return std::make_shared<store::csv::ArrowCsvRecordSource>(ResolvePath(config.csv().path(), base_dir));
#else
      throw std::runtime_error("csv source requested but Arrow is not enabled at build time");
#endif

    case SourceConfig::kMemory:
    case SourceConfig::BACKEND_NOT_SET:
      break;
  }
  return std::make_shared<store::memory::MemoryRecordSource>();
}

std::shared_ptr<store::ResolutionSink> BuildSink(const SinkConfig& config, const std::string& base_dir) {
  switch (config.backend_case()) {
    case SinkConfig::kSqlite:
#if RESOLVER_DB_SQLITE
      return std::make_shared<store::sqlite::SqliteResolutionSink>(OpenSqlite(ResolvePath(config.sqlite().path(), base_dir)));
#else
      throw std::runtime_error("sqlite sink requested but not enabled at build time");
#endif

    case SinkConfig::kPostgres:
#if RESOLVER_DB_POSTGRES
      return std::make_shared<store::postgres::PgResolutionSink>(OpenPostgres(config.postgres()));
#else
      throw std::runtime_error("postgres sink requested but not enabled at build time");
#endif

    case SinkConfig::kMemory:
    case SinkConfig::BACKEND_NOT_SET:
      break;
  }
  return std::make_shared<store::memory::MemoryResolutionSink>();
}

Runtime Build(const resolver::runtime::config::RuntimeConfig& config, const std::string& base_dir) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Backends
  // ------------------------------------------------------------------
  runtime.source = BuildSource(config.source(), base_dir);
  runtime.sink   = BuildSink(config.sink(), base_dir);

  RESOLVER_LOG_INFO("Backends ready", {observability::StringField("source", runtime.source->Describe()),
                                       observability::StringField("sink", runtime.sink->Describe())});

  // ------------------------------------------------------------------
  // Engine + query
  // ------------------------------------------------------------------
  auto options         = resolver::config::EngineOptions::FromConfig(config, base_dir);
  runtime.golden_store = std::make_shared<query::GoldenRecordStore>();
  runtime.engine       = std::make_shared<pipeline::ResolutionEngine>(options, runtime.source, runtime.sink, runtime.golden_store);
  runtime.query        = std::make_shared<query::QueryService>(runtime.golden_store, runtime.source, runtime.engine->aliases(),
                                                              runtime.engine->scorer(), runtime.engine->variants());

  return runtime;
}

} // namespace resolver::factory
