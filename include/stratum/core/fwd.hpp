#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for stratum_core module

#include <cstdint>

namespace stratum_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct RegistryError;
struct LayerViolationError;
struct DeferredError;
struct UnitError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace stratum_core
