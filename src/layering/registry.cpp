/// @file registry.cpp
/// @brief Layer registry implementation

#include <stratum/layering/registry.hpp>
#include <stratum/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace stratum_layering {

// =============================================================================
// Canonical Table
// =============================================================================

const std::vector<LayerAssignment>& canonical_layer_table() {
    static const std::vector<LayerAssignment> table = {
        {"Scheme", 1},
        {"Point", 1},
        {"Spec", 2},
        {"AmbientSpace", 2},
        {"Morphism", 2},
        {"ToricMorphism", 3},
        {"Glue", 3},
        {"Homset", 4},
        {"AffineScheme", 5},
        {"ProjectiveScheme", 5},
        {"ToricVariety", 5},
        {"AlgebraicScheme", 6},
        {"FanoToricVariety", 6},
        {"Hypersurface", 7},
        {"Divisor", 8},
        {"DivisorGroup", 9},
        {"ToricDivisor", 10},
    };
    return table;
}

// =============================================================================
// LayerRegistry Implementation
// =============================================================================

stratum_core::Result<LayerRegistry> LayerRegistry::build(
    const std::vector<LayerAssignment>& table) {

    LayerRegistry registry;

    for (const auto& row : table) {
        if (row.type_name.empty()) {
            return stratum_core::Err<LayerRegistry>(stratum_core::RegistryError::empty_name());
        }
        if (!is_valid_layer(row.layer)) {
            return stratum_core::Err<LayerRegistry>(
                stratum_core::RegistryError::invalid_layer(row.type_name, row.layer));
        }
        if (!registry.m_layers.emplace(row.type_name, row.layer).second) {
            return stratum_core::Err<LayerRegistry>(
                stratum_core::RegistryError::duplicate_type(row.type_name));
        }
    }

    return stratum_core::Ok(std::move(registry));
}

const LayerRegistry& LayerRegistry::canonical() {
    static const LayerRegistry registry = [] {
        auto result = build(canonical_layer_table());
        if (!result) {
            stratum_core::registry_logger()->critical(
                "Canonical layer table is malformed: {}", result.error().message());
        }
        auto built = std::move(result).unwrap();
        stratum_core::registry_logger()->debug(
            "Canonical layer registry initialized with {} types", built.size());
        return built;
    }();
    return registry;
}

stratum_core::Result<LayerLevel> LayerRegistry::layer_of(const std::string& type_name) const {
    auto it = m_layers.find(type_name);
    if (it == m_layers.end()) {
        return stratum_core::Err<LayerLevel>(stratum_core::RegistryError::unknown_type(type_name));
    }
    return stratum_core::Ok(it->second);
}

std::vector<LayerGroup> LayerRegistry::all_layers() const {
    std::map<LayerLevel, std::set<std::string>> grouped;
    for (const auto& [name, layer] : m_layers) {
        grouped[layer].insert(name);
    }

    std::vector<LayerGroup> groups;
    groups.reserve(grouped.size());
    for (auto& [layer, names] : grouped) {
        groups.push_back(LayerGroup{layer, std::move(names)});
    }
    return groups;
}

std::set<std::string> LayerRegistry::types_in_layer(LayerLevel layer) const {
    std::set<std::string> names;
    for (const auto& [name, level] : m_layers) {
        if (level == layer) {
            names.insert(name);
        }
    }
    return names;
}

stratum_core::Result<bool> LayerRegistry::may_reference(
    const std::string& from, const std::string& to) const {

    auto from_layer = layer_of(from);
    if (!from_layer) {
        return stratum_core::Err<bool>(from_layer.error());
    }
    auto to_layer = layer_of(to);
    if (!to_layer) {
        return stratum_core::Err<bool>(to_layer.error());
    }

    return stratum_core::Ok(*to_layer < *from_layer);
}

std::vector<std::string> LayerRegistry::load_order() const {
    std::vector<std::string> order;
    order.reserve(m_layers.size());
    for (const auto& group : all_layers()) {
        order.insert(order.end(), group.type_names.begin(), group.type_names.end());
    }
    return order;
}

std::string LayerRegistry::format_table() const {
    std::ostringstream oss;
    for (const auto& group : all_layers()) {
        oss << "layer " << group.layer << ":";
        for (const auto& name : group.type_names) {
            oss << " " << name;
        }
        oss << "\n";
    }
    return oss.str();
}

stratum_core::Result<LayerLevel> layer_of(const std::string& type_name) {
    return LayerRegistry::canonical().layer_of(type_name);
}

} // namespace stratum_layering
