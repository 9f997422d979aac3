/// @file error.cpp
/// @brief Error handling implementation for stratum_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <stratum/core/error.hpp>
#include <sstream>
#include <vector>

namespace stratum_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_registry_error(const RegistryError& err) {
    std::ostringstream oss;
    oss << "[RegistryError] " << err.message;

    if (!err.type_name.empty()) {
        oss << " (type: " << err.type_name << ")";
    }

    return oss.str();
}

std::string format_layer_violation_error(const LayerViolationError& err) {
    std::ostringstream oss;
    oss << "[LayerViolationError] " << err.message;
    return oss.str();
}

std::string format_deferred_error(const DeferredError& err) {
    std::ostringstream oss;
    oss << "[DeferredError] " << err.message;

    if (!err.from_type.empty() && !err.to_type.empty()) {
        oss << " (reference: " << err.from_type << " -> " << err.to_type << ")";
    }

    return oss.str();
}

std::string format_unit_error(const UnitError& err) {
    std::ostringstream oss;
    oss << "[UnitError] " << err.message;

    if (!err.unit.empty()) {
        oss << " (unit: " << err.unit << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, RegistryError>) {
            oss << detail::format_registry_error(err);
        } else if constexpr (std::is_same_v<T, LayerViolationError>) {
            oss << detail::format_layer_violation_error(err);
        } else if constexpr (std::is_same_v<T, DeferredError>) {
            oss << detail::format_deferred_error(err);
        } else if constexpr (std::is_same_v<T, UnitError>) {
            oss << detail::format_unit_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace stratum_core
