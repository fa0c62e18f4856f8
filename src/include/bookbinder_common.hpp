#pragma once

#include "duckdb/common/common.hpp"
#include "duckdb/common/file_system.hpp"

namespace bookbinder {

using duckdb::FileSystem;
using duckdb::idx_t;
using duckdb::make_uniq;
using duckdb::string;
using duckdb::unique_ptr;
using duckdb::vector;

} // namespace bookbinder
