// stratum_layering UnitCatalog tests

#include <catch2/catch_test_macros.hpp>
#include <stratum/layering/unit.hpp>
#include <stratum/layering/canonical.hpp>
#include <stratum/layering/graph.hpp>

#include <any>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stratum_layering;
using namespace stratum_core;

// =============================================================================
// Definition
// =============================================================================

TEST_CASE("UnitCatalog definition", "[layering][unit]") {
    UnitCatalog catalog;

    SECTION("define and query") {
        REQUIRE(catalog.define(UnitDefinition{"Scheme", {}, nullptr, nullptr}).is_ok());
        REQUIRE(catalog.is_defined("Scheme"));
        REQUIRE(catalog.status("Scheme") == UnitStatus::Defined);
        REQUIRE_FALSE(catalog.is_loaded("Scheme"));
        REQUIRE(catalog.load_count("Scheme") == 0);
        REQUIRE(catalog.size() == 1);
        REQUIRE_FALSE(catalog.status("Spec").has_value());
    }

    SECTION("unregistered type rejected") {
        auto result = catalog.define(UnitDefinition{"Sheaf", {}, nullptr, nullptr});
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<RegistryError>()->kind == RegistryError::Kind::UnknownType);
    }

    SECTION("unregistered import rejected") {
        auto result = catalog.define(UnitDefinition{"Spec", {"Sheaf"}, nullptr, nullptr});
        REQUIRE(result.is_err());
        REQUIRE(result.error().get_context("imported_by") != nullptr);
    }

    SECTION("duplicate definition rejected") {
        REQUIRE(catalog.define(UnitDefinition{"Point", {}, nullptr, nullptr}).is_ok());
        auto result = catalog.define(UnitDefinition{"Point", {}, nullptr, nullptr});
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<UnitError>()->kind == UnitError::Kind::AlreadyDefined);
    }

    SECTION("define_from_graph") {
        REQUIRE(catalog.define_from_graph(canonical_reference_graph()).is_ok());
        REQUIRE(catalog.size() == 17);
    }
}

// =============================================================================
// Loading
// =============================================================================

TEST_CASE("UnitCatalog loading", "[layering][unit]") {
    UnitCatalog catalog;
    REQUIRE(catalog.define_from_graph(canonical_reference_graph(), {
        {"Spec", [] { return std::any(std::string("Spec(ZZ)")); }},
    }).is_ok());

    SECTION("eager imports load first") {
        auto facility = catalog.load("Homset");
        REQUIRE(facility.is_ok());
        REQUIRE((*facility)->type_name == "Homset");
        REQUIRE((*facility)->layer == 4);

        auto log = catalog.load_log();
        REQUIRE(log.back() == "Homset");
        REQUIRE(catalog.is_loaded("Scheme"));
        REQUIRE(catalog.is_loaded("Spec"));
        REQUIRE(catalog.is_loaded("Morphism"));
        REQUIRE(catalog.is_loaded("Point"));
        REQUIRE_FALSE(catalog.is_loaded("AffineScheme"));
    }

    SECTION("loading does not follow deferred references") {
        REQUIRE(catalog.load("Scheme").is_ok());
        REQUIRE(catalog.load_log() == std::vector<std::string>{"Scheme"});
        REQUIRE(catalog.status("Spec") == UnitStatus::Defined);
    }

    SECTION("a unit loads once") {
        auto first = catalog.load("Morphism");
        auto second = catalog.load("Morphism");
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        REQUIRE(*first == *second);
        REQUIRE(catalog.load_count("Morphism") == 1);
        REQUIRE(catalog.load_count("Scheme") == 1);
    }

    SECTION("facility constructs instances") {
        auto spec = catalog.load("Spec");
        REQUIRE(spec.is_ok());
        REQUIRE((*spec)->can_construct());
        REQUIRE(std::any_cast<std::string>((*spec)->make()) == "Spec(ZZ)");

        auto scheme = catalog.facility("Scheme");
        REQUIRE(scheme.is_ok());
        REQUIRE_FALSE((*scheme)->can_construct());
        REQUIRE_FALSE((*scheme)->make().has_value());
    }

    SECTION("facility does not load") {
        auto result = catalog.facility("Glue");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidState);
        REQUIRE_FALSE(catalog.is_loaded("Glue"));
    }

    SECTION("undefined unit") {
        UnitCatalog empty;
        auto result = empty.load("Scheme");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<UnitError>()->kind == UnitError::Kind::NotDefined);
    }
}

TEST_CASE("UnitCatalog failures", "[layering][unit]") {
    SECTION("eager import cycle") {
        auto registry = LayerRegistry::build({{"A", 1}, {"B", 2}});
        REQUIRE(registry.is_ok());

        UnitCatalog catalog(*registry);
        REQUIRE(catalog.define(UnitDefinition{"A", {"B"}, nullptr, nullptr}).is_ok());
        REQUIRE(catalog.define(UnitDefinition{"B", {"A"}, nullptr, nullptr}).is_ok());

        auto result = catalog.load("A");
        REQUIRE(result.is_err());
        const auto* err = result.error().as<UnitError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->kind == UnitError::Kind::CyclicLoad);
        REQUIRE(err->path == "A -> B -> A");

        REQUIRE(catalog.status("A") == UnitStatus::Failed);
        REQUIRE(catalog.status("B") == UnitStatus::Failed);
        REQUIRE(catalog.load_log().empty());
    }

    SECTION("initializer error") {
        UnitCatalog catalog;
        UnitDefinition def;
        def.type_name = "Point";
        def.on_load = [] { return Err(Error(ErrorCode::InvalidState, "no base ring")); };
        REQUIRE(catalog.define(std::move(def)).is_ok());

        auto result = catalog.load("Point");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<UnitError>()->kind == UnitError::Kind::InitFailed);
        REQUIRE(result.error().message().find("no base ring") != std::string::npos);
        REQUIRE(catalog.status("Point") == UnitStatus::Failed);

        SECTION("failed unit stays failed") {
            auto again = catalog.load("Point");
            REQUIRE(again.is_err());
            REQUIRE(catalog.load_count("Point") == 0);
        }
    }

    SECTION("failed import fails the importer") {
        UnitCatalog catalog;
        UnitDefinition scheme;
        scheme.type_name = "Scheme";
        scheme.on_load = [] { return Err(Error("broken")); };
        REQUIRE(catalog.define(std::move(scheme)).is_ok());
        REQUIRE(catalog.define(UnitDefinition{"Spec", {"Scheme"}, nullptr, nullptr}).is_ok());

        REQUIRE(catalog.load("Spec").is_err());
        REQUIRE(catalog.status("Spec") == UnitStatus::Failed);
    }

    SECTION("throwing initializer") {
        UnitCatalog catalog;
        UnitDefinition scheme;
        scheme.type_name = "Scheme";
        scheme.on_load = []() -> Result<void> { throw std::runtime_error("boom"); };
        REQUIRE(catalog.define(std::move(scheme)).is_ok());
        REQUIRE(catalog.define(UnitDefinition{"Spec", {"Scheme"}, nullptr, nullptr}).is_ok());
        REQUIRE(catalog.define(UnitDefinition{"Point", {}, nullptr, nullptr}).is_ok());

        auto result = catalog.load("Scheme");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<UnitError>()->kind == UnitError::Kind::InitFailed);
        REQUIRE(result.error().message().find("boom") != std::string::npos);
        REQUIRE(catalog.status("Scheme") == UnitStatus::Failed);

        // No stale load stack: later loads fail cleanly or succeed, never as cycles
        auto again = catalog.load("Scheme");
        REQUIRE(again.is_err());
        REQUIRE(again.error().as<UnitError>()->kind == UnitError::Kind::InitFailed);

        auto spec = catalog.load("Spec");
        REQUIRE(spec.is_err());
        REQUIRE(spec.error().as<UnitError>()->kind != UnitError::Kind::CyclicLoad);
        REQUIRE(catalog.status("Spec") == UnitStatus::Failed);

        REQUIRE(catalog.load("Point").is_ok());
        REQUIRE(catalog.load_log() == std::vector<std::string>{"Point"});
    }
}

TEST_CASE("unit_status_name", "[layering][unit]") {
    REQUIRE(std::string(unit_status_name(UnitStatus::Loading)) == "Loading");
    REQUIRE(std::string(unit_status_name(UnitStatus::Failed)) == "Failed");
}
