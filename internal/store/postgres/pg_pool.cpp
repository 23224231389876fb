#include "pg_pool.hpp"

namespace resolver::store::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_record",
               "SELECT id,source_key,manufacturer,part_number,title,description,unspsc,gtin "
               "FROM records WHERE id=$1");

  conn.prepare("list_records",
               "SELECT id,source_key,manufacturer,part_number,title,description,unspsc,gtin "
               "FROM records ORDER BY id");

  conn.prepare("upsert_record",
               "INSERT INTO records(id,source_key,manufacturer,part_number,title,description,unspsc,gtin) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
               "ON CONFLICT(id) DO UPDATE SET source_key=EXCLUDED.source_key,manufacturer=EXCLUDED.manufacturer,"
               "part_number=EXCLUDED.part_number,title=EXCLUDED.title,description=EXCLUDED.description,"
               "unspsc=EXCLUDED.unspsc,gtin=EXCLUDED.gtin");

  conn.prepare("insert_golden_record",
               "INSERT INTO golden_records(id,manufacturer,part_number,unspsc,member_count,payload) "
               "VALUES($1,$2,$3,$4,$5,$6::jsonb)");

  conn.prepare("insert_golden_member", "INSERT INTO golden_record_members(record_id,golden_record_id) VALUES($1,$2)");

  conn.prepare("insert_pair_score",
               "INSERT INTO pair_scores(id_a,id_b,overall_score,payload) VALUES($1,$2,$3,$4::jsonb)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace resolver::store::postgres
