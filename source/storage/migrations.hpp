#ifndef INKWELL_MIGRATIONS_HPP
#define INKWELL_MIGRATIONS_HPP

// Schema scripts for the newsletter dataset, in application order.

#include "storage/storage_types.hpp"

#include <vector>

namespace migrations {

const std::vector<storage::Migration> &schema_migrations();

} // namespace migrations

#endif // INKWELL_MIGRATIONS_HPP
