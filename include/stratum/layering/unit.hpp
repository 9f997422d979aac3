#pragma once

/// @file unit.hpp
/// @brief Defining units: the loadable units that define entity types
///
/// Every entity type is defined by one unit. Loading a unit first loads the
/// units it eagerly imports, then runs its initializer and publishes the
/// type's facility (the constructor/factory the surrounding library
/// provides). A unit loads at most once; re-entering a unit that is still
/// loading is a load cycle and fails.

#include "fwd.hpp"
#include "registry.hpp"
#include <stratum/core/error.hpp>

#include <any>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stratum_layering {

// =============================================================================
// TypeFacility
// =============================================================================

/// Concrete facility published by a loaded unit
struct TypeFacility {
    std::string type_name;
    LayerLevel layer = 0;
    std::function<std::any()> construct;  ///< Factory for a default instance (may be empty)

    /// Check if the unit provides a factory
    [[nodiscard]] bool can_construct() const noexcept { return static_cast<bool>(construct); }

    /// Construct a default instance (empty std::any if no factory)
    [[nodiscard]] std::any make() const {
        return construct ? construct() : std::any{};
    }
};

/// Get status name
[[nodiscard]] inline const char* unit_status_name(UnitStatus status) {
    switch (status) {
        case UnitStatus::Defined: return "Defined";
        case UnitStatus::Loading: return "Loading";
        case UnitStatus::Loaded: return "Loaded";
        case UnitStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

// =============================================================================
// UnitDefinition
// =============================================================================

/// Definition of one unit, supplied by the surrounding library
struct UnitDefinition {
    std::string type_name;                                  ///< Entity type the unit defines
    std::vector<std::string> eager_imports;                 ///< Units loaded before this one
    std::function<std::any()> construct;                    ///< Facility factory (optional)
    std::function<stratum_core::Result<void>()> on_load;    ///< Load-time initializer (optional)
};

// =============================================================================
// UnitCatalog
// =============================================================================

/// Tracks the defining units of entity types and loads them on demand
///
/// Thread-safety: all operations lock an internal recursive mutex. Unit
/// initializers run with the lock held and may re-enter the catalog (for
/// example by resolving a deferred reference).
class UnitCatalog {
public:
    /// Catalog over the canonical registry
    UnitCatalog();

    /// Catalog over a custom registry (must outlive the catalog)
    explicit UnitCatalog(const LayerRegistry& registry);

    // Non-copyable, non-movable (contains std::recursive_mutex)
    UnitCatalog(const UnitCatalog&) = delete;
    UnitCatalog& operator=(const UnitCatalog&) = delete;
    UnitCatalog(UnitCatalog&&) = delete;
    UnitCatalog& operator=(UnitCatalog&&) = delete;

    // =========================================================================
    // Definition
    // =========================================================================

    /// Define a unit
    ///
    /// @return Ok, RegistryError::UnknownType for types the registry lacks,
    ///         or UnitError::AlreadyDefined
    [[nodiscard]] stratum_core::Result<void> define(UnitDefinition definition);

    /// Define one unit per graph type, importing its eager references
    ///
    /// @param graph Reference graph
    /// @param constructors Optional facility factories by type name
    [[nodiscard]] stratum_core::Result<void> define_from_graph(
        const EntityTypeGraph& graph,
        const std::map<std::string, std::function<std::any()>>& constructors = {});

    // =========================================================================
    // Loading
    // =========================================================================

    /// Load a unit and its eager imports
    ///
    /// @return Facility of the unit, or UnitError (NotDefined, CyclicLoad,
    ///         InitFailed)
    [[nodiscard]] stratum_core::Result<FacilityPtr> load(const std::string& type_name);

    /// Facility of an already loaded unit (does not load)
    [[nodiscard]] stratum_core::Result<FacilityPtr> facility(const std::string& type_name) const;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Status of a unit (nullopt if not defined)
    [[nodiscard]] std::optional<UnitStatus> status(const std::string& type_name) const;

    /// Check if a unit is defined
    [[nodiscard]] bool is_defined(const std::string& type_name) const;

    /// Check if a unit is loaded
    [[nodiscard]] bool is_loaded(const std::string& type_name) const;

    /// Number of times the unit's initializer ran (0 or 1)
    [[nodiscard]] std::size_t load_count(const std::string& type_name) const;

    /// Units in the order they finished loading
    [[nodiscard]] std::vector<std::string> load_log() const;

    /// Number of defined units
    [[nodiscard]] std::size_t size() const;

    /// Registry used for type lookups
    [[nodiscard]] const LayerRegistry& registry() const noexcept { return *m_registry; }

private:
    struct UnitEntry {
        UnitDefinition definition;
        UnitStatus status = UnitStatus::Defined;
        FacilityPtr facility;
        std::size_t load_count = 0;
        std::string error_message;  ///< Error if Failed
    };

    /// Load with the mutex held
    [[nodiscard]] stratum_core::Result<FacilityPtr> load_locked(const std::string& type_name);

    /// Current import chain formatted as "A -> B -> C"
    [[nodiscard]] std::string format_load_stack(const std::string& tail) const;

    const LayerRegistry* m_registry;
    mutable std::recursive_mutex m_mutex;
    std::map<std::string, UnitEntry> m_units;
    std::vector<std::string> m_load_stack;
    std::vector<std::string> m_load_log;
};

} // namespace stratum_layering
