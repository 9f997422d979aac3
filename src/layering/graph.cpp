/// @file graph.cpp
/// @brief Entity type reference graph and JSON parsing

#include <stratum/layering/graph.hpp>
#include <stratum/layering/registry.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace stratum_layering {

// =============================================================================
// ReferenceScope
// =============================================================================

const char* reference_scope_name(ReferenceScope scope) noexcept {
    switch (scope) {
        case ReferenceScope::Module: return "module";
        case ReferenceScope::TypeDefinition: return "type";
        case ReferenceScope::Method: return "method";
        case ReferenceScope::Call: return "call";
        default: return "unknown";
    }
}

bool reference_scope_from_string(const std::string& str, ReferenceScope& out) noexcept {
    if (str == "module") { out = ReferenceScope::Module; return true; }
    if (str == "type") { out = ReferenceScope::TypeDefinition; return true; }
    if (str == "method") { out = ReferenceScope::Method; return true; }
    if (str == "call") { out = ReferenceScope::Call; return true; }
    return false;
}

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

stratum_core::Error parse_error(const std::string& message) {
    return stratum_core::Error(stratum_core::ErrorCode::ParseError, message);
}

/// Parse one deferred entry: either "Spec" or { "to": "Spec", "site": ..., "scope": ... }
stratum_core::Result<DeferredDecl> parse_deferred(const nlohmann::json& j, const std::string& owner) {
    DeferredDecl decl;

    if (j.is_string()) {
        decl.to = j.get<std::string>();
        return stratum_core::Ok(decl);
    }

    if (!j.is_object() || !j.contains("to") || !j["to"].is_string()) {
        return stratum_core::Err<DeferredDecl>(
            parse_error("Deferred reference of '" + owner + "' missing 'to' field"));
    }
    decl.to = j["to"].get<std::string>();

    if (j.contains("site") && j["site"].is_string()) {
        decl.site = j["site"].get<std::string>();
    }

    if (j.contains("scope")) {
        if (!j["scope"].is_string()) {
            return stratum_core::Err<DeferredDecl>(
                parse_error("Deferred reference of '" + owner + "' has non-string 'scope'"));
        }
        std::string scope_str = j["scope"].get<std::string>();
        if (!reference_scope_from_string(scope_str, decl.scope)) {
            return stratum_core::Err<DeferredDecl>(
                parse_error("Invalid reference scope: " + scope_str));
        }
        if (is_load_time_scope(decl.scope)) {
            return stratum_core::Err<DeferredDecl>(
                stratum_core::DeferredError::invalid_scope(owner, decl.to, scope_str));
        }
    }

    return stratum_core::Ok(decl);
}

} // anonymous namespace

// =============================================================================
// EntityTypeGraph Building
// =============================================================================

EntityTypeGraph& EntityTypeGraph::add_type(const std::string& name) {
    auto& decl = m_types[name];
    decl.name = name;
    return *this;
}

EntityTypeGraph& EntityTypeGraph::add_eager(const std::string& from, const std::string& to) {
    add_type(to);
    add_type(from);
    m_types[from].eager.insert(to);
    return *this;
}

EntityTypeGraph& EntityTypeGraph::add_deferred(
    const std::string& from,
    const std::string& to,
    const std::string& site,
    ReferenceScope scope) {

    add_type(to);
    add_type(from);
    m_types[from].deferred.insert(DeferredDecl{to, site, scope});
    return *this;
}

// =============================================================================
// EntityTypeGraph Parsing
// =============================================================================

stratum_core::Result<EntityTypeGraph> EntityTypeGraph::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return stratum_core::Err<EntityTypeGraph>(
            stratum_core::Error(stratum_core::ErrorCode::NotFound,
                "Reference graph file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return stratum_core::Err<EntityTypeGraph>(
            stratum_core::Error(stratum_core::ErrorCode::IOError,
                "Failed to open reference graph file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str(), path);
}

stratum_core::Result<EntityTypeGraph> EntityTypeGraph::from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path) {

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return stratum_core::Err<EntityTypeGraph>(
            parse_error("JSON parse error in " + source_path.string() + ": " + e.what()));
    }

    if (!j.is_object() || !j.contains("types") || !j["types"].is_array()) {
        return stratum_core::Err<EntityTypeGraph>(
            parse_error("Missing 'types' array in reference graph"));
    }

    EntityTypeGraph graph;
    std::set<std::string> seen;

    for (const auto& entry : j["types"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            return stratum_core::Err<EntityTypeGraph>(
                parse_error("Type entry missing 'name' field"));
        }
        std::string name = entry["name"].get<std::string>();
        if (name.empty()) {
            return stratum_core::Err<EntityTypeGraph>(parse_error("Type entry has empty 'name'"));
        }
        if (!seen.insert(name).second) {
            return stratum_core::Err<EntityTypeGraph>(
                parse_error("Duplicate type entry: " + name));
        }
        graph.add_type(name);

        if (entry.contains("eager")) {
            if (!entry["eager"].is_array()) {
                return stratum_core::Err<EntityTypeGraph>(
                    parse_error("'eager' of '" + name + "' must be an array"));
            }
            for (const auto& ref : entry["eager"]) {
                if (!ref.is_string()) {
                    return stratum_core::Err<EntityTypeGraph>(
                        parse_error("Eager reference of '" + name + "' must be a string"));
                }
                graph.add_eager(name, ref.get<std::string>());
            }
        }

        if (entry.contains("deferred")) {
            if (!entry["deferred"].is_array()) {
                return stratum_core::Err<EntityTypeGraph>(
                    parse_error("'deferred' of '" + name + "' must be an array"));
            }
            for (const auto& ref : entry["deferred"]) {
                auto decl = parse_deferred(ref, name);
                if (!decl) {
                    return stratum_core::Err<EntityTypeGraph>(decl.error());
                }
                graph.add_deferred(name, decl->to, decl->site, decl->scope);
            }
        }
    }

    return stratum_core::Ok(std::move(graph));
}

std::string EntityTypeGraph::to_json_string() const {
    nlohmann::json types = nlohmann::json::array();

    for (const auto& [name, decl] : m_types) {
        nlohmann::json entry;
        entry["name"] = name;
        entry["eager"] = nlohmann::json::array();
        for (const auto& ref : decl.eager) {
            entry["eager"].push_back(ref);
        }
        if (!decl.deferred.empty()) {
            entry["deferred"] = nlohmann::json::array();
            for (const auto& ref : decl.deferred) {
                nlohmann::json d;
                d["to"] = ref.to;
                if (!ref.site.empty()) {
                    d["site"] = ref.site;
                }
                d["scope"] = reference_scope_name(ref.scope);
                entry["deferred"].push_back(std::move(d));
            }
        }
        types.push_back(std::move(entry));
    }

    nlohmann::json root;
    root["types"] = std::move(types);
    return root.dump(2);
}

// =============================================================================
// EntityTypeGraph Queries
// =============================================================================

const EntityTypeDecl* EntityTypeGraph::get(const std::string& name) const {
    auto it = m_types.find(name);
    if (it == m_types.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> EntityTypeGraph::type_names() const {
    std::vector<std::string> names;
    names.reserve(m_types.size());
    for (const auto& [name, _] : m_types) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> EntityTypeGraph::eager_references(const std::string& name) const {
    auto it = m_types.find(name);
    if (it == m_types.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.eager.begin(), it->second.eager.end());
}

std::vector<std::string> EntityTypeGraph::eager_dependents(const std::string& name) const {
    std::vector<std::string> dependents;
    for (const auto& [from, decl] : m_types) {
        if (decl.eager.count(name)) {
            dependents.push_back(from);
        }
    }
    return dependents;
}

std::size_t EntityTypeGraph::eager_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [_, decl] : m_types) {
        count += decl.eager.size();
    }
    return count;
}

std::size_t EntityTypeGraph::deferred_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [_, decl] : m_types) {
        count += decl.deferred.size();
    }
    return count;
}

// =============================================================================
// Debugging
// =============================================================================

namespace {

/// Quote-safe text for a DOT string literal
std::string dot_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

} // anonymous namespace

std::string EntityTypeGraph::to_dot_graph(const LayerRegistry& registry) const {
    std::ostringstream oss;
    oss << "digraph entity_types {\n";
    oss << "  rankdir=BT;\n";
    oss << "  node [shape=box];\n\n";

    std::map<LayerLevel, std::vector<std::string>> by_layer;
    std::vector<std::string> unregistered;
    for (const auto& [name, _] : m_types) {
        auto layer = registry.layer_of(name);
        if (layer) {
            by_layer[*layer].push_back(name);
        } else {
            unregistered.push_back(name);
        }
    }

    for (const auto& [layer, names] : by_layer) {
        oss << "  subgraph cluster_layer_" << layer << " {\n";
        oss << "    label=\"layer " << layer << "\";\n";
        for (const auto& name : names) {
            oss << "    \"" << dot_escape(name) << "\";\n";
        }
        oss << "  }\n";
    }
    for (const auto& name : unregistered) {
        oss << "  \"" << dot_escape(name) << "\" [style=filled, fillcolor=lightgray];\n";
    }
    oss << "\n";

    for (const auto& [name, decl] : m_types) {
        for (const auto& ref : decl.eager) {
            oss << "  \"" << dot_escape(name) << "\" -> \"" << dot_escape(ref) << "\";\n";
        }
        for (const auto& ref : decl.deferred) {
            oss << "  \"" << dot_escape(name) << "\" -> \"" << dot_escape(ref.to) << "\" [style=dashed";
            if (!ref.site.empty()) {
                oss << ", label=\"" << dot_escape(ref.site) << "\"";
            }
            oss << "];\n";
        }
    }

    oss << "}\n";
    return oss.str();
}

std::string EntityTypeGraph::format_dependency_tree(
    const std::string& root, const LayerRegistry& registry) const {

    std::string output;
    std::set<std::string> visited;
    format_tree_recursive(root, registry, output, "", visited);
    return output;
}

void EntityTypeGraph::format_tree_recursive(
    const std::string& name,
    const LayerRegistry& registry,
    std::string& output,
    const std::string& prefix,
    std::set<std::string>& visited) const {

    bool already_visited = visited.count(name) > 0;
    visited.insert(name);

    output += name;
    auto layer = registry.layer_of(name);
    if (layer) {
        output += " [layer " + std::to_string(*layer) + "]";
    } else {
        output += " [unregistered]";
    }

    auto it = m_types.find(name);
    if (it == m_types.end()) {
        output += " (NOT DECLARED)\n";
        return;
    }
    if (already_visited) {
        output += " (see above)\n";
        return;
    }
    output += "\n";

    const auto& eager = it->second.eager;
    std::size_t index = 0;
    for (const auto& dep : eager) {
        bool is_last = (++index == eager.size());
        output += prefix + (is_last ? "`-" : "|-");
        format_tree_recursive(dep, registry, output, prefix + (is_last ? "  " : "| "), visited);
    }
}

} // namespace stratum_layering
