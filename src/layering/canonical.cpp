/// @file canonical.cpp
/// @brief Audited reference graph of the geometric object library

#include <stratum/layering/canonical.hpp>

namespace stratum_layering {

const EntityTypeGraph& canonical_reference_graph() {
    static const EntityTypeGraph graph = [] {
        EntityTypeGraph g;

        // Layer 1
        g.add_type("Scheme");
        g.add_type("Point");
        g.add_deferred("Scheme", "Spec", "Scheme::base_scheme");
        g.add_deferred("Scheme", "Homset", "Scheme::hom");
        g.add_deferred("Scheme", "Morphism", "Scheme::structure_morphism");
        g.add_deferred("Point", "Morphism", "Point::as_morphism");

        // Layer 2
        g.add_eager("Spec", "Scheme");
        g.add_eager("AmbientSpace", "Scheme");
        g.add_eager("Morphism", "Scheme");
        g.add_eager("Morphism", "Point");
        g.add_deferred("Spec", "AffineScheme", "Spec::as_affine_scheme");
        g.add_deferred("AmbientSpace", "AlgebraicScheme", "AmbientSpace::subscheme");
        g.add_deferred("Morphism", "Homset", "Morphism::parent");
        g.add_deferred("Morphism", "Glue", "Morphism::glue_along_domains");

        // Layer 3
        g.add_eager("ToricMorphism", "Morphism");
        g.add_eager("Glue", "Morphism");
        g.add_eager("Glue", "Scheme");

        // Layer 4
        g.add_eager("Homset", "Scheme");
        g.add_eager("Homset", "Spec");
        g.add_eager("Homset", "Morphism");
        g.add_eager("Homset", "Point");

        // Layer 5
        g.add_eager("AffineScheme", "AmbientSpace");
        g.add_eager("AffineScheme", "Spec");
        g.add_eager("AffineScheme", "Homset");
        g.add_eager("ProjectiveScheme", "AmbientSpace");
        g.add_eager("ProjectiveScheme", "Morphism");
        g.add_eager("ProjectiveScheme", "Homset");
        g.add_eager("ToricVariety", "AmbientSpace");
        g.add_eager("ToricVariety", "ToricMorphism");
        g.add_eager("ToricVariety", "Homset");
        g.add_deferred("ToricVariety", "FanoToricVariety", "ToricVariety::is_fano");
        g.add_deferred("ToricVariety", "DivisorGroup", "ToricVariety::divisor_group");
        g.add_deferred("ToricVariety", "ToricDivisor", "ToricVariety::divisor");
        g.add_deferred("ProjectiveScheme", "AlgebraicScheme", "ProjectiveScheme::subscheme");

        // Layer 6
        g.add_eager("AlgebraicScheme", "AffineScheme");
        g.add_eager("AlgebraicScheme", "ProjectiveScheme");
        g.add_eager("AlgebraicScheme", "ToricVariety");
        g.add_eager("AlgebraicScheme", "Spec");
        g.add_eager("FanoToricVariety", "ToricVariety");
        g.add_deferred("AlgebraicScheme", "Hypersurface", "AlgebraicScheme::hypersurface");
        g.add_deferred("AlgebraicScheme", "Divisor", "AlgebraicScheme::divisor");

        // Layer 7
        g.add_eager("Hypersurface", "AlgebraicScheme");
        g.add_eager("Hypersurface", "AmbientSpace");

        // Layer 8
        g.add_eager("Divisor", "AlgebraicScheme");
        g.add_eager("Divisor", "Hypersurface");
        g.add_deferred("Divisor", "DivisorGroup", "Divisor::parent");

        // Layer 9
        g.add_eager("DivisorGroup", "Divisor");
        g.add_eager("DivisorGroup", "AlgebraicScheme");

        // Layer 10
        g.add_eager("ToricDivisor", "DivisorGroup");
        g.add_eager("ToricDivisor", "Divisor");
        g.add_eager("ToricDivisor", "ToricVariety");

        return g;
    }();
    return graph;
}

} // namespace stratum_layering
