#pragma once

#include "fcat/catalog/database.hpp"
#include "fcat/core/result.hpp"

namespace fcat::catalog {

/**
 * @brief Bring the catalog schema up to date
 *
 * Migrations are applied in order, each in its own transaction, and
 * recorded by name in _migrations so reopening a catalog is a no-op.
 *
 * RETURNS: number of migrations applied by this call
 */
Result<std::size_t> apply_migrations(Database& db);

} // namespace fcat::catalog
