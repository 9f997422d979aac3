/// @file deferred.cpp
/// @brief Deferred reference resolution

#include <stratum/layering/deferred.hpp>
#include <stratum/core/log.hpp>

namespace stratum_layering {

namespace {

const std::string& empty_string() {
    static const std::string empty;
    return empty;
}

} // anonymous namespace

// =============================================================================
// DeferredReference
// =============================================================================

DeferredReference::DeferredReference(
    std::string from_type,
    std::string to_type,
    ReferenceScope scope,
    std::string site,
    ResolveFn resolve_fn)
    : m_state(std::make_shared<State>()) {

    m_state->from_type = std::move(from_type);
    m_state->to_type = std::move(to_type);
    m_state->scope = scope;
    m_state->site = std::move(site);
    m_state->resolve_fn = std::move(resolve_fn);
}

const std::string& DeferredReference::from_type() const {
    return m_state ? m_state->from_type : empty_string();
}

const std::string& DeferredReference::to_type() const {
    return m_state ? m_state->to_type : empty_string();
}

ReferenceScope DeferredReference::scope() const {
    return m_state ? m_state->scope : ReferenceScope::Method;
}

const std::string& DeferredReference::site() const {
    return m_state ? m_state->site : empty_string();
}

bool DeferredReference::is_bound() const noexcept {
    return m_state && static_cast<bool>(m_state->resolve_fn);
}

bool DeferredReference::is_resolved() const {
    if (!m_state) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->cached != nullptr;
}

std::size_t DeferredReference::resolution_count() const noexcept {
    return m_state ? m_state->resolutions.load(std::memory_order_relaxed) : 0;
}

stratum_core::Result<FacilityPtr> DeferredReference::resolve() const {
    if (!is_bound()) {
        return stratum_core::Err<FacilityPtr>(
            stratum_core::DeferredError::unbound(from_type(), to_type()));
    }

    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->cached) {
            return stratum_core::Ok(m_state->cached);
        }
    }

    // Resolve outside the lock; concurrent first uses may both get here
    m_state->resolutions.fetch_add(1, std::memory_order_relaxed);
    auto resolved = m_state->resolve_fn();
    if (!resolved) {
        stratum_core::Error err = resolved.error();
        err.with_context("deferred_reference", m_state->from_type + " -> " + m_state->to_type);
        if (!m_state->site.empty()) {
            err.with_context("site", m_state->site);
        }
        return stratum_core::Err<FacilityPtr>(std::move(err));
    }

    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (!m_state->cached) {
        m_state->cached = *resolved;
    }
    return stratum_core::Ok(m_state->cached);
}

// =============================================================================
// DeferredResolver
// =============================================================================

DeferredResolver::DeferredResolver(UnitCatalog& catalog)
    : m_catalog(&catalog) {}

stratum_core::Result<DeferredReference> DeferredResolver::declare(
    const std::string& from_type,
    const std::string& to_type,
    ReferenceScope scope,
    const std::string& site) const {

    const auto& registry = m_catalog->registry();
    auto from_layer = registry.layer_of(from_type);
    if (!from_layer) {
        return stratum_core::Err<DeferredReference>(from_layer.error());
    }
    auto to_layer = registry.layer_of(to_type);
    if (!to_layer) {
        return stratum_core::Err<DeferredReference>(to_layer.error());
    }

    if (is_load_time_scope(scope)) {
        stratum_core::deferred_logger()->error("Rejected {}-scope deferred reference {} -> {}",
            reference_scope_name(scope), from_type, to_type);
        return stratum_core::Err<DeferredReference>(
            stratum_core::DeferredError::invalid_scope(from_type, to_type, reference_scope_name(scope)));
    }

    if (*to_layer < *from_layer) {
        stratum_core::deferred_logger()->debug(
            "Deferred reference {} -> {} targets a lower layer; an eager reference would do",
            from_type, to_type);
    }

    UnitCatalog* catalog = m_catalog;
    auto resolve_fn = [catalog, from_type, to_type]() -> stratum_core::Result<FacilityPtr> {
        // The referencing unit is loaded (or loading) whenever one of its
        // operations runs; it is never loaded here.
        auto owner = catalog->status(from_type);
        if (owner != UnitStatus::Loaded && owner != UnitStatus::Loading) {
            return stratum_core::Err<FacilityPtr>(
                stratum_core::DeferredError::owner_not_loaded(from_type, to_type));
        }

        auto facility = catalog->load(to_type);
        if (facility) {
            stratum_core::deferred_logger()->debug("Resolved deferred reference {} -> {}",
                from_type, to_type);
        }
        return facility;
    };

    return stratum_core::Ok(DeferredReference(from_type, to_type, scope, site, std::move(resolve_fn)));
}

stratum_core::Result<std::vector<DeferredReference>> DeferredResolver::declare_all(
    const EntityTypeGraph& graph, const std::string& from_type) const {

    const auto* decl = graph.get(from_type);
    if (!decl) {
        return stratum_core::Err<std::vector<DeferredReference>>(
            stratum_core::RegistryError::unknown_type(from_type));
    }

    std::vector<DeferredReference> references;
    references.reserve(decl->deferred.size());
    for (const auto& deferred : decl->deferred) {
        auto ref = declare(from_type, deferred.to, deferred.scope, deferred.site);
        if (!ref) {
            return stratum_core::Err<std::vector<DeferredReference>>(ref.error());
        }
        references.push_back(std::move(*ref));
    }
    return stratum_core::Ok(std::move(references));
}

// =============================================================================
// Free Functions
// =============================================================================

stratum_core::Result<DeferredReference> declare_deferred(
    UnitCatalog& catalog,
    const std::string& from_type,
    const std::string& to_type,
    ReferenceScope scope,
    const std::string& site) {
    return DeferredResolver(catalog).declare(from_type, to_type, scope, site);
}

stratum_core::Result<FacilityPtr> resolve(const DeferredReference& reference) {
    return reference.resolve();
}

} // namespace stratum_layering
