#pragma once

/// @file canonical.hpp
/// @brief Audited reference graph of the geometric object library
///
/// Lists every eager reference made by the defining units of the canonical
/// entity types, and every reference that has to be deferred because it
/// points to the same or a later layer. Validating this graph against the
/// canonical registry yields an empty report.

#include "fwd.hpp"
#include "graph.hpp"

namespace stratum_layering {

/// The audited eager/deferred reference graph (built once)
[[nodiscard]] const EntityTypeGraph& canonical_reference_graph();

} // namespace stratum_layering
