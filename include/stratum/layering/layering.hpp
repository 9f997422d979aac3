#pragma once

/// @file layering.hpp
/// @brief Main include file for stratum_layering module
///
/// This header includes all stratum_layering components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Layer table
#include "registry.hpp"

// Declared references and their validation
#include "graph.hpp"
#include "validator.hpp"
#include "canonical.hpp"

// Units and deferred binding
#include "unit.hpp"
#include "deferred.hpp"

// Build/test gate
#include "check.hpp"

/// @namespace stratum_layering
/// @brief Load-order layering of the geometric entity types
///
/// - **LayerRegistry**: immutable entity type -> layer table
/// - **DependencyValidator**: reports every eager reference that does not
///   point to a strictly lower layer
/// - **DeferredReference**: call-site binding to a same- or later-layer type,
///   loading its unit on first use
///
/// Example usage:
/// @code
/// #include <stratum/layering/layering.hpp>
///
/// using namespace stratum_layering;
///
/// auto report = validate(canonical_reference_graph());
/// if (report && report->empty()) {
///     // every eager reference points downward
/// }
///
/// UnitCatalog catalog;
/// (void)catalog.define_from_graph(canonical_reference_graph());
/// (void)catalog.load("Scheme");
///
/// auto spec = declare_deferred(catalog, "Scheme", "Spec",
///                              ReferenceScope::Method, "Scheme::base_scheme");
/// auto facility = spec->resolve();  // loads Spec's unit now
/// @endcode

