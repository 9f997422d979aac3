#pragma once

/// @file graph.hpp
/// @brief Declared reference graph between entity types
///
/// The surrounding library declares, for every entity type, the references
/// its defining unit makes:
/// - eager references, resolved while the unit loads (checked by the validator)
/// - deferred references, resolved inside an operation on first use
///   (excluded from validation)
///
/// Graphs can be built in code or parsed from JSON:
/// ```json
/// {
///   "types": [
///     { "name": "Scheme", "eager": [],
///       "deferred": [ { "to": "Spec", "site": "Scheme::base_scheme" } ] },
///     { "name": "Spec", "eager": ["Scheme"] }
///   ]
/// }
/// ```

#include "fwd.hpp"
#include <stratum/core/error.hpp>

#include <string>
#include <vector>
#include <map>
#include <set>
#include <filesystem>

namespace stratum_layering {

// =============================================================================
// ReferenceScope
// =============================================================================

/// Get scope name
[[nodiscard]] const char* reference_scope_name(ReferenceScope scope) noexcept;

/// Parse scope name ("module", "type", "method", "call")
[[nodiscard]] bool reference_scope_from_string(const std::string& str, ReferenceScope& out) noexcept;

/// Whether the scope is evaluated while the defining unit loads
[[nodiscard]] constexpr bool is_load_time_scope(ReferenceScope scope) noexcept {
    return scope == ReferenceScope::Module || scope == ReferenceScope::TypeDefinition;
}

// =============================================================================
// Declarations
// =============================================================================

/// A deferred reference declared by a type (not a load-time dependency)
struct DeferredDecl {
    std::string to;                                ///< Referenced type
    std::string site;                              ///< Declaring operation, e.g. "Scheme::base_scheme"
    ReferenceScope scope = ReferenceScope::Method;

    bool operator<(const DeferredDecl& other) const {
        if (to != other.to) return to < other.to;
        if (site != other.site) return site < other.site;
        return scope < other.scope;
    }

    bool operator==(const DeferredDecl& other) const {
        return to == other.to && site == other.site && scope == other.scope;
    }
};

/// References declared by one entity type
struct EntityTypeDecl {
    std::string name;
    std::set<std::string> eager;       ///< Load-time references
    std::set<DeferredDecl> deferred;   ///< Call-site references
};

// =============================================================================
// EntityTypeGraph
// =============================================================================

/// Snapshot of the declared references of a set of entity types
///
/// Eager references are stored as sets, so declaring the same reference
/// twice records it once.
class EntityTypeGraph {
public:
    EntityTypeGraph() = default;

    // =========================================================================
    // Building
    // =========================================================================

    /// Add a type with no references (no-op if present)
    EntityTypeGraph& add_type(const std::string& name);

    /// Declare an eager reference from -> to (adds both types)
    EntityTypeGraph& add_eager(const std::string& from, const std::string& to);

    /// Declare a deferred reference from -> to (adds both types)
    EntityTypeGraph& add_deferred(
        const std::string& from,
        const std::string& to,
        const std::string& site = {},
        ReferenceScope scope = ReferenceScope::Method);

    // =========================================================================
    // Parsing
    // =========================================================================

    /// Load a graph from a JSON file
    [[nodiscard]] static stratum_core::Result<EntityTypeGraph> load(
        const std::filesystem::path& path);

    /// Parse a graph from a JSON string
    [[nodiscard]] static stratum_core::Result<EntityTypeGraph> from_json_string(
        const std::string& json_str,
        const std::filesystem::path& source_path = {});

    /// Serialize to the JSON format accepted by from_json_string
    [[nodiscard]] std::string to_json_string() const;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Check if a type is declared
    [[nodiscard]] bool has_type(const std::string& name) const {
        return m_types.count(name) > 0;
    }

    /// Get a declaration (nullptr if absent)
    [[nodiscard]] const EntityTypeDecl* get(const std::string& name) const;

    /// All declared type names (sorted)
    [[nodiscard]] std::vector<std::string> type_names() const;

    /// Eager references of a type (empty if absent)
    [[nodiscard]] std::vector<std::string> eager_references(const std::string& name) const;

    /// Types that eagerly reference a given type
    [[nodiscard]] std::vector<std::string> eager_dependents(const std::string& name) const;

    /// Total number of eager references
    [[nodiscard]] std::size_t eager_count() const noexcept;

    /// Total number of deferred references
    [[nodiscard]] std::size_t deferred_count() const noexcept;

    /// Check if the graph is empty
    [[nodiscard]] bool empty() const noexcept { return m_types.empty(); }

    /// Number of declared types
    [[nodiscard]] std::size_t size() const noexcept { return m_types.size(); }

    /// Iteration over declarations
    [[nodiscard]] const std::map<std::string, EntityTypeDecl>& declarations() const noexcept {
        return m_types;
    }

    // =========================================================================
    // Debugging
    // =========================================================================

    /// Generate GraphViz DOT, grouped by layer; deferred edges dashed
    [[nodiscard]] std::string to_dot_graph(const LayerRegistry& registry) const;

    /// Format the eager dependency tree below a root type
    [[nodiscard]] std::string format_dependency_tree(
        const std::string& root, const LayerRegistry& registry) const;

private:
    void format_tree_recursive(
        const std::string& name,
        const LayerRegistry& registry,
        std::string& output,
        const std::string& prefix,
        std::set<std::string>& visited) const;

    std::map<std::string, EntityTypeDecl> m_types;
};

} // namespace stratum_layering
