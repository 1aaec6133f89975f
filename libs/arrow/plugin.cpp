// Tessera plugin entry point for the Arrow backend.
//
// Build as tessera_arrow.so and place it in a directory on
// TESSERA_PLUGIN_PATH; the dispatch registry loads it at initialization and
// frames wrapping std::shared_ptr<arrow::Table> resolve to the "arrow"
// adapter.

#include "arrow_adapter.hpp"

#include <tessera/dispatch/registry.hpp>

extern "C" void tessera_register(tessera::dispatch::RegistryBuilder* builder) {
    builder->add(std::make_shared<const tessera::arrow_backend::ArrowAdapter>());
}
