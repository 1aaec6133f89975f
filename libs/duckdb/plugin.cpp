// Tessera plugin entry point for the DuckDB backend.
//
// Build as tessera_duckdb.so and place it in a directory on
// TESSERA_PLUGIN_PATH. Frames wrapping std::shared_ptr<duckdb::Relation>
// resolve to the lazy "duckdb" adapter; DataFrame::lazy("duckdb") moves
// eager data into the adapter's in-memory database.

#include "duckdb_adapter.hpp"

#include <tessera/dispatch/registry.hpp>

extern "C" void tessera_register(tessera::dispatch::RegistryBuilder* builder) {
    builder->add(std::make_shared<const tessera::duckdb_backend::DuckDbAdapter>());
}
