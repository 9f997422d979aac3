#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for stratum_layering module

#include <cstdint>
#include <memory>

namespace stratum_layering {

// =============================================================================
// Entity Types
// =============================================================================

using LayerLevel = int;

/// First (lowest, loaded first) layer
inline constexpr LayerLevel kMinLayer = 1;

/// Last (highest, loaded last) layer
inline constexpr LayerLevel kMaxLayer = 10;

struct LayerAssignment;
struct LayerGroup;

// =============================================================================
// Registry
// =============================================================================

class LayerRegistry;

// =============================================================================
// Reference Graph
// =============================================================================

/// Where a deferred reference is declared
enum class ReferenceScope : std::uint8_t {
    Module,          ///< Top level of the defining unit (evaluated at load time)
    TypeDefinition,  ///< Type body (evaluated at load time)
    Method,          ///< Inside a method of the referencing type
    Call,            ///< Inside a single call expression
};

struct DeferredDecl;
struct EntityTypeDecl;
class EntityTypeGraph;

// =============================================================================
// Validator Types
// =============================================================================

struct LayerViolation;
class ValidationReport;
class DependencyValidator;

// =============================================================================
// Unit Types
// =============================================================================

/// Defining unit status during lifecycle
enum class UnitStatus : std::uint8_t {
    Defined,  ///< Known but not loaded
    Loading,  ///< Currently loading
    Loaded,   ///< Fully loaded, facility available
    Failed,   ///< Failed to load
};

struct TypeFacility;
using FacilityPtr = std::shared_ptr<const TypeFacility>;
struct UnitDefinition;
class UnitCatalog;

// =============================================================================
// Deferred Types
// =============================================================================

class DeferredReference;
class DeferredResolver;

// =============================================================================
// Check Runner
// =============================================================================

enum class OutputFormat : std::uint8_t;
struct CheckConfig;

} // namespace stratum_layering
