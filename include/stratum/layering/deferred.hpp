#pragma once

/// @file deferred.hpp
/// @brief Deferred references: call-site-scoped lazy binding
///
/// A type that needs a type from its own or a later layer cannot reference
/// it eagerly. It declares a DeferredReference inside the operation that
/// needs it; the referenced unit is loaded the first time the reference is
/// resolved, never as part of loading the referencing unit.
///
/// Example (Scheme needs a default Spec as its base scheme):
/// ```cpp
/// stratum_core::Result<std::any> Scheme::base_scheme() const {
///     auto ref = m_resolver->declare("Scheme", "Spec", ReferenceScope::Method,
///                                    "Scheme::base_scheme");
///     if (!ref) {
///         return stratum_core::Err<std::any>(ref.error());
///     }
///     auto spec = ref->resolve();
///     if (!spec) {
///         return stratum_core::Err<std::any>(spec.error());
///     }
///     return stratum_core::Ok((*spec)->make());
/// }
/// ```

#include "fwd.hpp"
#include "graph.hpp"
#include "unit.hpp"
#include <stratum/core/error.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace stratum_layering {

// =============================================================================
// DeferredReference
// =============================================================================

/// Handle to a postponed dependency between two entity types
///
/// Copies share one resolution cache. Resolution is idempotent: resolving
/// twice yields the same facility, and concurrent first resolutions keep the
/// first stored result and discard the rest.
class DeferredReference {
public:
    /// Resolution function (invoked only when the reference is used)
    using ResolveFn = std::function<stratum_core::Result<FacilityPtr>()>;

    /// Unbound reference
    DeferredReference() = default;

    /// Bind a reference to a resolution function
    DeferredReference(
        std::string from_type,
        std::string to_type,
        ReferenceScope scope,
        std::string site,
        ResolveFn resolve_fn);

    /// Referencing type
    [[nodiscard]] const std::string& from_type() const;

    /// Referenced type
    [[nodiscard]] const std::string& to_type() const;

    /// Scope of the declaring site
    [[nodiscard]] ReferenceScope scope() const;

    /// Declaring site (may be empty)
    [[nodiscard]] const std::string& site() const;

    /// Check if a resolution function is bound
    [[nodiscard]] bool is_bound() const noexcept;

    /// Check if a result is cached
    [[nodiscard]] bool is_resolved() const;

    /// Times the resolution function ran
    [[nodiscard]] std::size_t resolution_count() const noexcept;

    /// Resolve to the referenced type's facility, loading its unit on first use
    [[nodiscard]] stratum_core::Result<FacilityPtr> resolve() const;

private:
    struct State {
        std::string from_type;
        std::string to_type;
        ReferenceScope scope = ReferenceScope::Method;
        std::string site;
        ResolveFn resolve_fn;

        mutable std::mutex mutex;
        FacilityPtr cached;
        std::atomic<std::size_t> resolutions{0};
    };

    std::shared_ptr<State> m_state;
};

// =============================================================================
// DeferredResolver
// =============================================================================

/// Declares deferred references whose resolution loads units from a catalog
class DeferredResolver {
public:
    /// Resolver over a catalog (must outlive every reference it declares)
    explicit DeferredResolver(UnitCatalog& catalog);

    /// Declare a deferred reference
    ///
    /// @return Reference, RegistryError::UnknownType for unregistered types,
    ///         or DeferredError::InvalidScope when the scope is evaluated
    ///         while the referencing unit loads (Module, TypeDefinition)
    [[nodiscard]] stratum_core::Result<DeferredReference> declare(
        const std::string& from_type,
        const std::string& to_type,
        ReferenceScope scope,
        const std::string& site = {}) const;

    /// Declare every deferred reference of one graph type
    [[nodiscard]] stratum_core::Result<std::vector<DeferredReference>> declare_all(
        const EntityTypeGraph& graph, const std::string& from_type) const;

    /// Catalog the resolver loads from
    [[nodiscard]] UnitCatalog& catalog() const noexcept { return *m_catalog; }

private:
    UnitCatalog* m_catalog;
};

// =============================================================================
// Free Functions
// =============================================================================

/// Declare a deferred reference against a catalog
[[nodiscard]] stratum_core::Result<DeferredReference> declare_deferred(
    UnitCatalog& catalog,
    const std::string& from_type,
    const std::string& to_type,
    ReferenceScope scope,
    const std::string& site = {});

/// Resolve a deferred reference
[[nodiscard]] stratum_core::Result<FacilityPtr> resolve(const DeferredReference& reference);

} // namespace stratum_layering
