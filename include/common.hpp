//! # Common Definitions
//!
//! Types and helpers shared by every enumgen component.
//!
//! ## Overview
//!
//! - **Version Information**: Generator version constants
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Alias for unique ownership
//!
//! All fallible operations in the loader, resolver and assembler return
//! `Result<T, RegistryError>` instead of throwing.

#ifndef ENUMGEN_COMMON_HPP
#define ENUMGEN_COMMON_HPP

#include <memory>
#include <string>
#include <variant>

namespace enumgen {

// ============================================================================
// Version Information
// ============================================================================

/// The generator version string.
constexpr const char* VERSION = "0.3.0";

/// Name written into the "generated by" line of every artifact.
constexpr const char* GENERATOR_NAME = "enumgen";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<int64_t, RegistryError> r = resolver.resolve(type, decl, nullptr);
/// if (is_ok(r)) {
///     int64_t value = unwrap(r);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace enumgen

#endif // ENUMGEN_COMMON_HPP
