#pragma once

/// @file registry.hpp
/// @brief Layer registry: the authoritative entity type -> layer table
///
/// Layers are numbered in load order. Layer 1 loads first and may not
/// eagerly reference anything in layers 2-10; a type in layer N may eagerly
/// reference only types in layers 1..N-1.

#include "fwd.hpp"
#include <stratum/core/error.hpp>

#include <string>
#include <vector>
#include <map>
#include <set>

namespace stratum_layering {

// =============================================================================
// Table Entries
// =============================================================================

/// One row of a layer table
struct LayerAssignment {
    std::string type_name;
    LayerLevel layer = 0;
};

/// All entity types sharing one layer
struct LayerGroup {
    LayerLevel layer = 0;
    std::set<std::string> type_names;
};

/// Check whether a layer number lies in [kMinLayer, kMaxLayer]
[[nodiscard]] constexpr bool is_valid_layer(LayerLevel layer) noexcept {
    return layer >= kMinLayer && layer <= kMaxLayer;
}

// =============================================================================
// LayerRegistry
// =============================================================================

/// Immutable mapping of entity type names to layers
///
/// A registry is built once and never mutated afterwards; every query is
/// const, so concurrent readers need no synchronization. The canonical
/// registry is a process-wide instance initialized on first use.
class LayerRegistry {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    /// Build a registry from a table
    ///
    /// @param table Rows of (type name, layer)
    /// @return Registry, or RegistryError on empty/duplicate names or layers
    ///         outside [kMinLayer, kMaxLayer]
    [[nodiscard]] static stratum_core::Result<LayerRegistry> build(
        const std::vector<LayerAssignment>& table);

    /// The canonical geometric-object registry (built once, never mutated)
    [[nodiscard]] static const LayerRegistry& canonical();

    // =========================================================================
    // Queries
    // =========================================================================

    /// Layer of an entity type
    ///
    /// @return Layer, or RegistryError::UnknownType
    [[nodiscard]] stratum_core::Result<LayerLevel> layer_of(const std::string& type_name) const;

    /// All layers in ascending order, each with its type names
    [[nodiscard]] std::vector<LayerGroup> all_layers() const;

    /// Names in one layer (empty if none)
    [[nodiscard]] std::set<std::string> types_in_layer(LayerLevel layer) const;

    /// Whether `from` may eagerly reference `to` (layer(to) < layer(from))
    [[nodiscard]] stratum_core::Result<bool> may_reference(
        const std::string& from, const std::string& to) const;

    /// Unit load order implied by the table: ascending layer, then name
    [[nodiscard]] std::vector<std::string> load_order() const;

    /// Check if a type is registered
    [[nodiscard]] bool contains(const std::string& type_name) const {
        return m_layers.count(type_name) > 0;
    }

    /// Number of registered types
    [[nodiscard]] std::size_t size() const noexcept { return m_layers.size(); }

    /// Check if registry is empty
    [[nodiscard]] bool empty() const noexcept { return m_layers.empty(); }

    /// Format the table, one line per layer
    [[nodiscard]] std::string format_table() const;

private:
    LayerRegistry() = default;

    std::map<std::string, LayerLevel> m_layers;
};

/// The canonical table rows
[[nodiscard]] const std::vector<LayerAssignment>& canonical_layer_table();

/// Shorthand for LayerRegistry::canonical().layer_of(name)
[[nodiscard]] stratum_core::Result<LayerLevel> layer_of(const std::string& type_name);

} // namespace stratum_layering
