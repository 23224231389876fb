#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace resolver::store::postgres {

void BootstrapPostgresSchema(const std::shared_ptr<PgPool>& pool);

} // namespace resolver::store::postgres
