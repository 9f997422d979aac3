#pragma once

/// @file error.hpp
/// @brief Error handling types for stratum_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace stratum_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    DependencyMissing,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Layer registry errors
struct RegistryError {
    enum class Kind : std::uint8_t {
        UnknownType,    // Name absent from the registry
        DuplicateType,  // Name assigned to more than one layer
        InvalidLayer,   // Layer number outside the permitted range
        EmptyName,      // Entity type without a name
    };

    Kind kind;
    std::string message;
    std::string type_name;
    int layer = 0;  // For InvalidLayer

    [[nodiscard]] static RegistryError unknown_type(const std::string& name) {
        return RegistryError{Kind::UnknownType, "Unknown entity type: " + name, name, 0};
    }

    [[nodiscard]] static RegistryError duplicate_type(const std::string& name) {
        return RegistryError{Kind::DuplicateType, "Entity type assigned twice: " + name, name, 0};
    }

    [[nodiscard]] static RegistryError invalid_layer(const std::string& name, int layer) {
        return RegistryError{Kind::InvalidLayer,
            "Entity type '" + name + "' has invalid layer " + std::to_string(layer), name, layer};
    }

    [[nodiscard]] static RegistryError empty_name() {
        return RegistryError{Kind::EmptyName, "Entity type name is empty", {}, 0};
    }
};

/// Aggregated layering violations from one validator run
struct LayerViolationError {
    std::string message;
    std::size_t violation_count = 0;

    [[nodiscard]] static LayerViolationError from_report(std::size_t count, const std::string& details) {
        return LayerViolationError{
            std::to_string(count) + " layer violation(s):\n" + details, count};
    }
};

/// Deferred reference errors
struct DeferredError {
    enum class Kind : std::uint8_t {
        InvalidScope,      // Declared at a scope evaluated while the unit loads
        OwnerNotLoaded,    // Resolved outside the referencing unit's operations
        Unbound,           // Reference has no resolution function
    };

    Kind kind;
    std::string message;
    std::string from_type;
    std::string to_type;

    [[nodiscard]] static DeferredError invalid_scope(
        const std::string& from, const std::string& to, const std::string& scope) {
        return DeferredError{Kind::InvalidScope,
            "Deferred reference '" + from + "' -> '" + to + "' cannot be declared at " + scope + " scope",
            from, to};
    }

    [[nodiscard]] static DeferredError owner_not_loaded(const std::string& from, const std::string& to) {
        return DeferredError{Kind::OwnerNotLoaded,
            "Deferred reference '" + from + "' -> '" + to + "' resolved before '" + from + "' was loaded",
            from, to};
    }

    [[nodiscard]] static DeferredError unbound(const std::string& from, const std::string& to) {
        return DeferredError{Kind::Unbound,
            "Deferred reference '" + from + "' -> '" + to + "' has no resolver", from, to};
    }
};

/// Defining-unit errors
struct UnitError {
    enum class Kind : std::uint8_t {
        NotDefined,      // No unit defines this type
        AlreadyDefined,  // Unit defined twice
        CyclicLoad,      // Unit re-entered while still loading
        InitFailed,      // Unit factory failed
    };

    Kind kind;
    std::string message;
    std::string unit;
    std::string path;  // For CyclicLoad

    [[nodiscard]] static UnitError not_defined(const std::string& name) {
        return UnitError{Kind::NotDefined, "Unit not defined: " + name, name, {}};
    }

    [[nodiscard]] static UnitError already_defined(const std::string& name) {
        return UnitError{Kind::AlreadyDefined, "Unit already defined: " + name, name, {}};
    }

    [[nodiscard]] static UnitError cyclic_load(const std::string& name, const std::string& path) {
        return UnitError{Kind::CyclicLoad,
            "Unit '" + name + "' loaded while still loading: " + path, name, path};
    }

    [[nodiscard]] static UnitError init_failed(const std::string& name, const std::string& reason) {
        return UnitError{Kind::InitFailed, "Unit '" + name + "' init failed: " + reason, name, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        RegistryError,
        LayerViolationError,
        DeferredError,
        UnitError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(RegistryError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(LayerViolationError err) : m_code(ErrorCode::ValidationError), m_error(std::move(err)) {}
    Error(DeferredError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(UnitError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(RegistryError::Kind kind) {
        switch (kind) {
            case RegistryError::Kind::UnknownType: return ErrorCode::NotFound;
            case RegistryError::Kind::DuplicateType: return ErrorCode::AlreadyExists;
            case RegistryError::Kind::InvalidLayer: return ErrorCode::InvalidArgument;
            case RegistryError::Kind::EmptyName: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(DeferredError::Kind kind) {
        switch (kind) {
            case DeferredError::Kind::InvalidScope: return ErrorCode::InvalidArgument;
            case DeferredError::Kind::OwnerNotLoaded: return ErrorCode::InvalidState;
            case DeferredError::Kind::Unbound: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(UnitError::Kind kind) {
        switch (kind) {
            case UnitError::Kind::NotDefined: return ErrorCode::NotFound;
            case UnitError::Kind::AlreadyDefined: return ErrorCode::AlreadyExists;
            case UnitError::Kind::CyclicLoad: return ErrorCode::DependencyMissing;
            case UnitError::Kind::InitFailed: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with category and context
std::string build_error_chain(const Error& error);

} // namespace stratum_core
