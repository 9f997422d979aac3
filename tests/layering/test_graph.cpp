// stratum_layering EntityTypeGraph tests

#include <catch2/catch_test_macros.hpp>
#include <stratum/layering/graph.hpp>
#include <stratum/layering/registry.hpp>

#include <filesystem>
#include <fstream>

using namespace stratum_layering;
using namespace stratum_core;

// =============================================================================
// Building
// =============================================================================

TEST_CASE("EntityTypeGraph building", "[layering][graph]") {
    EntityTypeGraph graph;

    SECTION("empty graph") {
        REQUIRE(graph.empty());
        REQUIRE(graph.size() == 0);
        REQUIRE(graph.eager_count() == 0);
    }

    SECTION("references add both endpoints") {
        graph.add_eager("Spec", "Scheme");
        graph.add_deferred("Scheme", "Homset", "Scheme::hom");

        REQUIRE(graph.size() == 3);
        REQUIRE(graph.has_type("Homset"));
        REQUIRE(graph.eager_references("Spec") == std::vector<std::string>{"Scheme"});
        REQUIRE(graph.eager_references("Scheme").empty());
        REQUIRE(graph.eager_count() == 1);
        REQUIRE(graph.deferred_count() == 1);
    }

    SECTION("repeated declarations recorded once") {
        graph.add_eager("Spec", "Scheme");
        graph.add_eager("Spec", "Scheme");
        REQUIRE(graph.eager_count() == 1);
    }

    SECTION("eager_dependents") {
        graph.add_eager("Spec", "Scheme").add_eager("Morphism", "Scheme").add_eager("Morphism", "Point");
        REQUIRE(graph.eager_dependents("Scheme") == std::vector<std::string>{"Morphism", "Spec"});
        REQUIRE(graph.eager_dependents("Spec").empty());
    }

    SECTION("get") {
        graph.add_deferred("Point", "Morphism", "Point::as_morphism", ReferenceScope::Call);
        const auto* decl = graph.get("Point");
        REQUIRE(decl != nullptr);
        REQUIRE(decl->deferred.size() == 1);
        REQUIRE(decl->deferred.begin()->scope == ReferenceScope::Call);
        REQUIRE(graph.get("Glue") == nullptr);
    }
}

// =============================================================================
// ReferenceScope
// =============================================================================

TEST_CASE("ReferenceScope names", "[layering][graph]") {
    ReferenceScope scope = ReferenceScope::Method;

    REQUIRE(reference_scope_from_string("module", scope));
    REQUIRE(scope == ReferenceScope::Module);
    REQUIRE(reference_scope_from_string("type", scope));
    REQUIRE(scope == ReferenceScope::TypeDefinition);
    REQUIRE(reference_scope_from_string("call", scope));
    REQUIRE(scope == ReferenceScope::Call);
    REQUIRE_FALSE(reference_scope_from_string("global", scope));

    REQUIRE(std::string(reference_scope_name(ReferenceScope::Method)) == "method");

    STATIC_REQUIRE(is_load_time_scope(ReferenceScope::Module));
    STATIC_REQUIRE(is_load_time_scope(ReferenceScope::TypeDefinition));
    STATIC_REQUIRE_FALSE(is_load_time_scope(ReferenceScope::Method));
    STATIC_REQUIRE_FALSE(is_load_time_scope(ReferenceScope::Call));
}

// =============================================================================
// JSON
// =============================================================================

TEST_CASE("EntityTypeGraph JSON parsing", "[layering][graph]") {
    SECTION("eager and deferred references") {
        auto result = EntityTypeGraph::from_json_string(R"({
            "types": [
                { "name": "Scheme",
                  "deferred": [ { "to": "Spec", "site": "Scheme::base_scheme" }, "Homset" ] },
                { "name": "Spec", "eager": ["Scheme"] }
            ]
        })");

        REQUIRE(result.is_ok());
        REQUIRE(result->size() == 3);
        REQUIRE(result->eager_references("Spec") == std::vector<std::string>{"Scheme"});

        const auto* scheme = result->get("Scheme");
        REQUIRE(scheme != nullptr);
        REQUIRE(scheme->deferred.size() == 2);
        auto first = *scheme->deferred.begin();
        REQUIRE(first.to == "Homset");
        REQUIRE(first.scope == ReferenceScope::Method);
    }

    SECTION("malformed JSON") {
        auto result = EntityTypeGraph::from_json_string("{ not json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("missing types array") {
        auto result = EntityTypeGraph::from_json_string(R"({ "entities": [] })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("entry without name") {
        auto result = EntityTypeGraph::from_json_string(R"({ "types": [ { "eager": [] } ] })");
        REQUIRE(result.is_err());
    }

    SECTION("duplicate entry") {
        auto result = EntityTypeGraph::from_json_string(
            R"({ "types": [ { "name": "Spec" }, { "name": "Spec" } ] })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("Duplicate") != std::string::npos);
    }

    SECTION("unknown scope name") {
        auto result = EntityTypeGraph::from_json_string(R"({ "types": [
            { "name": "Scheme", "deferred": [ { "to": "Spec", "scope": "global" } ] } ] })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("module-scope deferred reference rejected") {
        auto result = EntityTypeGraph::from_json_string(R"({ "types": [
            { "name": "Scheme", "deferred": [ { "to": "Spec", "scope": "module" } ] } ] })");
        REQUIRE(result.is_err());
        const auto* err = result.error().as<DeferredError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->kind == DeferredError::Kind::InvalidScope);
        REQUIRE(err->from_type == "Scheme");
        REQUIRE(err->to_type == "Spec");
    }

    SECTION("serialized graph parses back to the same references") {
        EntityTypeGraph graph;
        graph.add_eager("Morphism", "Scheme")
             .add_eager("Morphism", "Point")
             .add_deferred("Morphism", "Homset", "Morphism::parent", ReferenceScope::Call);

        auto parsed = EntityTypeGraph::from_json_string(graph.to_json_string());
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed->eager_references("Morphism") == graph.eager_references("Morphism"));
        REQUIRE(parsed->get("Morphism")->deferred == graph.get("Morphism")->deferred);
    }
}

TEST_CASE("EntityTypeGraph::load", "[layering][graph]") {
    auto dir = std::filesystem::temp_directory_path() / "stratum_graph_test";
    std::filesystem::create_directories(dir);

    SECTION("file") {
        auto path = dir / "graph.json";
        {
            std::ofstream file(path);
            file << R"({ "types": [ { "name": "Glue", "eager": ["Morphism", "Scheme"] } ] })";
        }
        auto result = EntityTypeGraph::load(path);
        REQUIRE(result.is_ok());
        REQUIRE(result->eager_count() == 2);
    }

    SECTION("missing file") {
        auto result = EntityTypeGraph::load(dir / "missing.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    std::filesystem::remove_all(dir);
}

// =============================================================================
// Debugging Output
// =============================================================================

TEST_CASE("EntityTypeGraph debugging output", "[layering][graph]") {
    const auto& registry = LayerRegistry::canonical();

    EntityTypeGraph graph;
    graph.add_eager("Homset", "Morphism")
         .add_eager("Homset", "Scheme")
         .add_eager("Morphism", "Scheme")
         .add_deferred("Scheme", "Homset", "Scheme::hom");

    SECTION("DOT groups by layer") {
        std::string dot = graph.to_dot_graph(registry);
        REQUIRE(dot.find("digraph entity_types {") == 0);
        REQUIRE(dot.find("subgraph cluster_layer_4") != std::string::npos);
        REQUIRE(dot.find("\"Homset\" -> \"Morphism\";") != std::string::npos);
        REQUIRE(dot.find("\"Scheme\" -> \"Homset\" [style=dashed, label=\"Scheme::hom\"];")
            != std::string::npos);
    }

    SECTION("DOT escapes quotes and backslashes in labels") {
        EntityTypeGraph quoted;
        quoted.add_deferred("Scheme", "Spec", "Scheme::\"hom\" \\ base");
        std::string dot = quoted.to_dot_graph(registry);
        REQUIRE(dot.find("label=\"Scheme::\\\"hom\\\" \\\\ base\"];") != std::string::npos);
    }

    SECTION("dependency tree") {
        std::string tree = graph.format_dependency_tree("Homset", registry);
        REQUIRE(tree ==
            "Homset [layer 4]\n"
            "|-Morphism [layer 2]\n"
            "| `-Scheme [layer 1]\n"
            "`-Scheme [layer 1] (see above)\n");
    }

    SECTION("tree marks undeclared roots") {
        std::string tree = graph.format_dependency_tree("Glue", registry);
        REQUIRE(tree == "Glue [layer 3] (NOT DECLARED)\n");
    }
}
