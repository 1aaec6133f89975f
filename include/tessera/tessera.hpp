#pragma once

/// Convenience umbrella header for the Tessera library.

#include <tessera/core/config.hpp>
#include <tessera/core/error.hpp>
#include <tessera/core/scalar.hpp>
#include <tessera/dispatch/registry.hpp>
#include <tessera/dtype/dtype.hpp>
#include <tessera/frame/frame.hpp>
#include <tessera/ir/expr.hpp>
