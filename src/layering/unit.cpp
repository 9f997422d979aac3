/// @file unit.cpp
/// @brief Defining unit catalog implementation

#include <stratum/layering/unit.hpp>
#include <stratum/layering/graph.hpp>
#include <stratum/core/log.hpp>

#include <exception>

namespace stratum_layering {

UnitCatalog::UnitCatalog()
    : m_registry(&LayerRegistry::canonical()) {}

UnitCatalog::UnitCatalog(const LayerRegistry& registry)
    : m_registry(&registry) {}

// =============================================================================
// Definition
// =============================================================================

stratum_core::Result<void> UnitCatalog::define(UnitDefinition definition) {
    if (!m_registry->contains(definition.type_name)) {
        return stratum_core::Err(stratum_core::RegistryError::unknown_type(definition.type_name));
    }
    for (const auto& import : definition.eager_imports) {
        if (!m_registry->contains(import)) {
            return stratum_core::Err(stratum_core::Error(stratum_core::RegistryError::unknown_type(import))
                .with_context("imported_by", definition.type_name));
        }
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (m_units.count(definition.type_name)) {
        return stratum_core::Err(stratum_core::UnitError::already_defined(definition.type_name));
    }

    std::string name = definition.type_name;
    m_units[name] = UnitEntry{std::move(definition), UnitStatus::Defined, nullptr, 0, {}};
    stratum_core::deferred_logger()->trace("Defined unit '{}'", name);

    return stratum_core::Ok();
}

stratum_core::Result<void> UnitCatalog::define_from_graph(
    const EntityTypeGraph& graph,
    const std::map<std::string, std::function<std::any()>>& constructors) {

    for (const auto& [name, decl] : graph.declarations()) {
        UnitDefinition def;
        def.type_name = name;
        def.eager_imports.assign(decl.eager.begin(), decl.eager.end());

        auto ctor = constructors.find(name);
        if (ctor != constructors.end()) {
            def.construct = ctor->second;
        }

        auto result = define(std::move(def));
        if (!result) {
            return result;
        }
    }

    return stratum_core::Ok();
}

// =============================================================================
// Loading
// =============================================================================

stratum_core::Result<FacilityPtr> UnitCatalog::load(const std::string& type_name) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return load_locked(type_name);
}

stratum_core::Result<FacilityPtr> UnitCatalog::load_locked(const std::string& type_name) {
    auto it = m_units.find(type_name);
    if (it == m_units.end()) {
        stratum_core::Error err = stratum_core::UnitError::not_defined(type_name);
        if (!m_load_stack.empty()) {
            err.with_context("imported_by", m_load_stack.back());
        }
        return stratum_core::Err<FacilityPtr>(std::move(err));
    }

    auto logger = stratum_core::deferred_logger();

    switch (it->second.status) {
        case UnitStatus::Loaded:
            return stratum_core::Ok(it->second.facility);

        case UnitStatus::Loading: {
            std::string path = format_load_stack(type_name);
            logger->error("Load cycle detected: {}", path);
            return stratum_core::Err<FacilityPtr>(stratum_core::UnitError::cyclic_load(type_name, path));
        }

        case UnitStatus::Failed:
            return stratum_core::Err<FacilityPtr>(
                stratum_core::UnitError::init_failed(type_name, it->second.error_message));

        case UnitStatus::Defined:
            break;
    }

    it->second.status = UnitStatus::Loading;
    m_load_stack.push_back(type_name);

    // Copy: initializers may define further units and invalidate `it`
    const std::vector<std::string> imports = it->second.definition.eager_imports;
    auto fail = [this, &type_name](const stratum_core::Error& error) {
        auto& entry = m_units[type_name];
        entry.status = UnitStatus::Failed;
        entry.error_message = error.message();
        m_load_stack.pop_back();
        return stratum_core::Err<FacilityPtr>(error);
    };

    for (const auto& import : imports) {
        auto imported = load_locked(import);
        if (!imported) {
            return fail(imported.error());
        }
    }

    auto on_load = m_units[type_name].definition.on_load;
    if (on_load) {
        stratum_core::Result<void> init = stratum_core::Ok();
        try {
            init = on_load();
        } catch (const std::exception& e) {
            return fail(stratum_core::UnitError::init_failed(type_name, e.what()));
        }
        if (!init) {
            if (init.error().is<stratum_core::UnitError>()) {
                return fail(init.error());
            }
            return fail(stratum_core::UnitError::init_failed(type_name, init.error().message()));
        }
    }

    auto& entry = m_units[type_name];
    auto facility = std::make_shared<TypeFacility>();
    facility->type_name = type_name;
    facility->layer = m_registry->layer_of(type_name).value_or(0);
    facility->construct = entry.definition.construct;

    entry.facility = facility;
    entry.status = UnitStatus::Loaded;
    ++entry.load_count;
    m_load_stack.pop_back();
    m_load_log.push_back(type_name);

    logger->debug("Loaded unit '{}' (layer {})", type_name, facility->layer);
    return stratum_core::Ok(entry.facility);
}

stratum_core::Result<FacilityPtr> UnitCatalog::facility(const std::string& type_name) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto it = m_units.find(type_name);
    if (it == m_units.end()) {
        return stratum_core::Err<FacilityPtr>(stratum_core::UnitError::not_defined(type_name));
    }
    if (it->second.status != UnitStatus::Loaded) {
        return stratum_core::Err<FacilityPtr>(stratum_core::Error(stratum_core::ErrorCode::InvalidState,
            "Unit '" + type_name + "' is " + unit_status_name(it->second.status)));
    }
    return stratum_core::Ok(it->second.facility);
}

// =============================================================================
// Queries
// =============================================================================

std::optional<UnitStatus> UnitCatalog::status(const std::string& type_name) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_units.find(type_name);
    if (it == m_units.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

bool UnitCatalog::is_defined(const std::string& type_name) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_units.count(type_name) > 0;
}

bool UnitCatalog::is_loaded(const std::string& type_name) const {
    return status(type_name) == UnitStatus::Loaded;
}

std::size_t UnitCatalog::load_count(const std::string& type_name) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_units.find(type_name);
    return it == m_units.end() ? 0 : it->second.load_count;
}

std::vector<std::string> UnitCatalog::load_log() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_load_log;
}

std::size_t UnitCatalog::size() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_units.size();
}

std::string UnitCatalog::format_load_stack(const std::string& tail) const {
    std::string path;
    for (const auto& name : m_load_stack) {
        path += name + " -> ";
    }
    return path + tail;
}

} // namespace stratum_layering
