#pragma once

/// @file validator.hpp
/// @brief Dependency validator for the layer hierarchy
///
/// The DependencyValidator checks every declared eager reference A -> B
/// against the registry and requires layer(B) < layer(A). Same-layer
/// references are violations. Deferred references are not load-time
/// dependencies and are not checked.
///
/// All violations of one run are collected into a ValidationReport instead
/// of stopping at the first, so a single build surfaces every offending
/// reference.

#include "fwd.hpp"
#include "graph.hpp"
#include "registry.hpp"
#include <stratum/core/error.hpp>

#include <optional>
#include <string>
#include <vector>

namespace stratum_layering {

// =============================================================================
// LayerViolation
// =============================================================================

/// An eager reference that does not point to a strictly lower layer
struct LayerViolation {
    std::string from_type;   ///< Type declaring the reference
    std::string to_type;     ///< Referenced type
    LayerLevel from_layer;   ///< Layer of from_type
    LayerLevel to_layer;     ///< Layer of to_type

    /// Whether both types share a layer
    [[nodiscard]] bool is_same_layer() const noexcept { return from_layer == to_layer; }

    /// Format as one report line
    [[nodiscard]] std::string format() const;

    bool operator==(const LayerViolation& other) const {
        return from_type == other.from_type && to_type == other.to_type &&
               from_layer == other.from_layer && to_layer == other.to_layer;
    }
};

// =============================================================================
// ValidationReport
// =============================================================================

/// All layering violations found by one validator run
///
/// Violations are ordered by (from_layer, from_type, to_type) and each
/// offending reference appears once.
class ValidationReport {
public:
    ValidationReport() = default;
    explicit ValidationReport(std::vector<LayerViolation> violations);

    /// True when no violation was found
    [[nodiscard]] bool empty() const noexcept { return m_violations.empty(); }

    /// Alias for empty()
    [[nodiscard]] bool passed() const noexcept { return m_violations.empty(); }

    /// Number of violations
    [[nodiscard]] std::size_t size() const noexcept { return m_violations.size(); }

    /// Violations in report order
    [[nodiscard]] const std::vector<LayerViolation>& violations() const noexcept {
        return m_violations;
    }

    /// Check whether the report contains a violation from -> to
    [[nodiscard]] bool contains(const std::string& from, const std::string& to) const;

    /// One line per violation (empty string if none)
    [[nodiscard]] std::string format() const;

    /// Fold into a single error (Ok if empty)
    [[nodiscard]] stratum_core::Result<void> to_result() const;

private:
    std::vector<LayerViolation> m_violations;
};

// =============================================================================
// DependencyValidator
// =============================================================================

/// Checks eager references of a graph against a registry
///
/// The validator only reads the registry and the graph, so it may run
/// repeatedly and concurrently.
class DependencyValidator {
public:
    /// Validate against the canonical registry
    DependencyValidator();

    /// Validate against a custom registry (must outlive the validator)
    explicit DependencyValidator(const LayerRegistry& registry);

    /// Validate all eager references of a graph
    ///
    /// @return Report (empty on success), or RegistryError::UnknownType when
    ///         the graph names a type the registry lacks, or
    ///         DeferredError::InvalidScope when a deferred reference is
    ///         declared at a load-time scope
    [[nodiscard]] stratum_core::Result<ValidationReport> validate(const EntityTypeGraph& graph) const;

    /// Validate and fold any violation into an error
    [[nodiscard]] stratum_core::Result<void> validate_or_error(const EntityTypeGraph& graph) const;

    /// Check a single eager reference
    ///
    /// @return Violation if the reference breaks the ordering, empty optional otherwise
    [[nodiscard]] stratum_core::Result<std::optional<LayerViolation>> check_reference(
        const std::string& from, const std::string& to) const;

    /// Registry used by this validator
    [[nodiscard]] const LayerRegistry& registry() const noexcept { return *m_registry; }

private:
    const LayerRegistry* m_registry;
};

/// Validate a graph against the canonical registry
[[nodiscard]] stratum_core::Result<ValidationReport> validate(const EntityTypeGraph& graph);

} // namespace stratum_layering
